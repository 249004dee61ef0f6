#pragma once

#include <string>

#include "types.hpp"

namespace CommandLine {

// Parses argv with getopt_long. Field edits are recorded in flag order.
// Throws ArgumentError on unknown options or malformed values; templates are
// only validated later, by the caller compiling them.
Options parse(int argc, char* argv[]);

std::string usage(std::string_view program);

}  // namespace CommandLine
