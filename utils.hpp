#pragma once

#include <charconv>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace fs = std::filesystem;

// A central utility to convert a std::filesystem::path to a UTF-8 encoded
// std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// The reverse of safe_path_to_string: tag values and rendered names are UTF-8.
inline fs::path utf8_to_path(std::string_view utf8) {
  return fs::path(std::u8string(reinterpret_cast<const char8_t*>(utf8.data()),
                                utf8.size()));
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, so multi-byte UTF-8 sequences pass
// through untouched.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

inline bool is_ascii_letter(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool is_ascii_digit(char c) { return c >= '0' && c <= '9'; }

inline const FieldSpec& field_spec(Field field) {
  for (const auto& spec : kFieldRegistry) {
    if (spec.field == field) return spec;
  }
  throw std::logic_error("field missing from registry");
}

// Case-insensitive lookup of a placeholder letter.
inline const FieldSpec* find_field_by_code(char code) {
  char lower = (code >= 'A' && code <= 'Z')
                   ? static_cast<char>(code + ('a' - 'A'))
                   : code;
  for (const auto& spec : kFieldRegistry) {
    if (spec.code == lower) return &spec;
  }
  return nullptr;
}

// Whole-string base-10 parse. Signs, blanks and trailing garbage are rejected.
inline std::optional<unsigned int> parse_unsigned(std::string_view text) {
  if (text.empty()) return std::nullopt;
  unsigned int value = 0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value, 10);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

enum class TrackStyle { Padded, Plain };

// Text form of a field value; an absent value is the empty string. Padded
// zero-pads track numbers to two digits for file names.
inline std::string field_text(const TagValues& values, const FieldSpec& spec,
                              TrackStyle track_style = TrackStyle::Padded) {
  if (spec.type == ValueType::Text) {
    auto it = values.text.find(spec.field);
    return it != values.text.end() ? it->second : std::string();
  }
  auto it = values.numbers.find(spec.field);
  if (it == values.numbers.end() || it->second == 0) return {};
  if (spec.field == Field::Track && track_style == TrackStyle::Padded) {
    return std::format("{:02}", it->second);
  }
  return std::to_string(it->second);
}

inline std::string_view describe(FileError error) {
  switch (error) {
    case FileError::OpenFailed:
      return "could not open file";
    case FileError::ExtractionMismatch:
      return "file name does not match extraction template";
    case FileError::SaveRefused:
      return "refusing to save this file format";
    case FileError::SaveFailed:
      return "failed to save tags";
    case FileError::RenameCollision:
      return "target file name already exists";
    case FileError::RenameFailed:
      return "rename failed";
  }
  return "unknown error";
}
