#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "types.hpp"

namespace Extractor {

// ECMAScript pattern matching a whole file stem against `spec`. Text fields
// capture greedily with (.+), Integer fields capture (\d+).
std::string build_pattern(const CompiledSpec& spec);

// build_pattern() compiled once, for matching many stems against one spec.
std::regex compile_pattern(const CompiledSpec& spec);

// Returns the field values captured from `stem`, or std::nullopt when the stem
// does not match the template. Later occurrences of a field win. `pattern`
// must come from compile_pattern(spec).
std::optional<TagValues> extract(const CompiledSpec& spec,
                                 const std::regex& pattern,
                                 std::string_view stem);
std::optional<TagValues> extract(const CompiledSpec& spec,
                                 std::string_view stem);

}  // namespace Extractor
