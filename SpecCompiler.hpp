#pragma once

#include <string>
#include <string_view>

#include "types.hpp"

namespace SpecCompiler {

// Tokenizes a template such as "%n - %_T" into literal runs and placeholders.
// Throws InvalidFieldError when a placeholder names a letter outside the
// field registry. A '%' that does not start a placeholder is kept as text.
CompiledSpec compile(std::string_view spec);

// Inverse of compile(), used for log messages.
std::string to_string(const CompiledSpec& spec);

}  // namespace SpecCompiler
