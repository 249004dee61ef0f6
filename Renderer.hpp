#pragma once

#include <string>

#include "Sanitizer.hpp"
#include "types.hpp"

namespace Renderer {

// Produces a file stem from `spec`. Every placeholder is replaced with its
// field's value, lowercased for lowercase letters, and passed through the
// sanitizer with the placeholder's substitution character.
std::string render(const CompiledSpec& spec, const TagValues& values,
                   const Sanitizer::DangerousClass& dangerous);

}  // namespace Renderer
