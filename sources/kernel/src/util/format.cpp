#include "util/format.hpp"

using OsStatusFormat = vsp::Format<OsStatusId>;

static std::string_view StatusName(OsStatusId status) {
    switch (status) {
    case OsStatusSuccess: return "Success";
    case OsStatusOutOfMemory: return "Out of memory";
    case OsStatusNotFound: return "Not found";
    case OsStatusInvalidInput: return "Invalid input";
    case OsStatusAlreadyExists: return "Already exists";
    case OsStatusInvalidData: return "Invalid data";
    case OsStatusInvalidAddress: return "Invalid address";
    case OsStatusNoSpace: return "No space";
    default: return "Unknown";
    }
}

void OsStatusFormat::format(IOutStream& out, OsStatusId value) {
    out.format(StatusName(value), " (", vsp::Hex(OsStatus(value)).pad(8, '0'), ")");
}
