#pragma once

#include "logger/logger.hpp"

constinit inline vsp::Logger MemLog { "MEM" };
constinit inline vsp::Logger VmLog { "VMM" };
constinit inline vsp::Logger TestLog { "TEST" };
