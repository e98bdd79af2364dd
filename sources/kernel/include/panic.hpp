#pragma once

#include <source_location>
#include <string_view>

namespace vsp {
    [[noreturn]]
    void BugCheck(std::string_view message, std::source_location where = std::source_location::current()) noexcept;
}

#define VSP_PANIC(msg) vsp::BugCheck(msg)
#define VSP_CHECK(expr, msg) do { if (!(expr)) { vsp::BugCheck(msg); } } while (0)
#define VSP_ASSERT(expr) do { if (!(expr)) { vsp::BugCheck(#expr); } } while (0)
