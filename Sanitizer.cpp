#include "Sanitizer.hpp"

#include <utility>

namespace {

bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

}  // namespace

bool Sanitizer::DangerousClass::contains(char c) const {
  if (whitespace && is_ascii_space(c)) return true;
  return characters.find(c) != std::string_view::npos;
}

const Sanitizer::DangerousClass& Sanitizer::shell_unsafe() {
  static const DangerousClass cls{"`~!#$%^&*()=[{}\\|;:\",<>/?", true};
  return cls;
}

const Sanitizer::DangerousClass& Sanitizer::filesystem_unsafe() {
  static const DangerousClass cls{"<>:\"/\\|?*", true};
  return cls;
}

const Sanitizer::DangerousClass& Sanitizer::no_dangerous_characters() {
  static const DangerousClass cls{"", false};
  return cls;
}

const Sanitizer::DangerousClass& Sanitizer::class_for(SanitizeMode mode) {
  switch (mode) {
    case SanitizeMode::Shell:
      return shell_unsafe();
    case SanitizeMode::Filesystem:
      return filesystem_unsafe();
    case SanitizeMode::None:
      break;
  }
  return no_dangerous_characters();
}

std::string Sanitizer::sanitize(std::string_view value,
                                std::string_view substitute,
                                const DangerousClass& dangerous) {
  // Apostrophes are always stripped, so one can never serve as a substitute.
  if (substitute == "'") substitute = {};

  std::string replaced;
  replaced.reserve(value.size());
  bool in_run = false;
  for (char c : value) {
    if (c == '\'') continue;
    if (dangerous.contains(c)) {
      if (!in_run) replaced += substitute;
      in_run = true;
      continue;
    }
    in_run = false;
    replaced += c;
  }

  std::string result;
  if (substitute.empty()) {
    result = std::move(replaced);
  } else {
    result.reserve(replaced.size());
    std::string_view rest = replaced;
    bool last_was_substitute = false;
    while (!rest.empty()) {
      if (rest.starts_with(substitute)) {
        if (!last_was_substitute) result += substitute;
        last_was_substitute = true;
        rest.remove_prefix(substitute.size());
      } else {
        result += rest.front();
        last_was_substitute = false;
        rest.remove_prefix(1);
      }
    }
    if (std::string_view(result).starts_with(substitute)) {
      result.erase(0, substitute.size());
    }
    if (std::string_view(result).ends_with(substitute)) {
      result.erase(result.size() - substitute.size());
    }
  }

  if (result.empty()) return "_";
  return result;
}
