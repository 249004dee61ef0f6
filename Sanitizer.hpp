#pragma once

#include <string>
#include <string_view>

#include "types.hpp"

namespace Sanitizer {

// A set of characters a sanitization mode considers unsafe. Whitespace is
// tracked separately from the listed punctuation.
struct DangerousClass {
  std::string_view characters;
  bool whitespace = false;

  bool contains(char c) const;
};

const DangerousClass& shell_unsafe();
const DangerousClass& filesystem_unsafe();
const DangerousClass& no_dangerous_characters();
const DangerousClass& class_for(SanitizeMode mode);

// Removes apostrophes, replaces each run of dangerous characters with a single
// `substitute`, collapses repeated substitutes and trims them from both ends.
// An empty result becomes "_" so an all-special-character value still yields
// a usable name. Idempotent for any fixed substitute and class.
std::string sanitize(std::string_view value, std::string_view substitute,
                     const DangerousClass& dangerous);

}  // namespace Sanitizer
