#include "Extractor.hpp"

#include "utils.hpp"

namespace {

std::string escape_regex(std::string_view text) {
  static constexpr std::string_view kSpecial = "\\^$.|?*+()[]{}";
  std::string escaped;
  escaped.reserve(text.size() * 2);
  for (char c : text) {
    if (kSpecial.find(c) != std::string_view::npos) escaped += '\\';
    escaped += c;
  }
  return escaped;
}

}  // namespace

std::string Extractor::build_pattern(const CompiledSpec& spec) {
  std::string pattern;
  for (const auto& token : spec) {
    if (const auto* literal = std::get_if<LiteralToken>(&token)) {
      pattern += escape_regex(literal->text);
      continue;
    }
    const auto& placeholder = std::get<PlaceholderToken>(token);
    pattern += field_spec(placeholder.field).type == ValueType::Integer
                   ? "(\\d+)"
                   : "(.+)";
  }
  return pattern;
}

std::regex Extractor::compile_pattern(const CompiledSpec& spec) {
  return std::regex(build_pattern(spec), std::regex::ECMAScript);
}

std::optional<TagValues> Extractor::extract(const CompiledSpec& spec,
                                            std::string_view stem) {
  return extract(spec, compile_pattern(spec), stem);
}

std::optional<TagValues> Extractor::extract(const CompiledSpec& spec,
                                            const std::regex& pattern,
                                            std::string_view stem) {
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_match(stem.begin(), stem.end(), match, pattern)) {
    return std::nullopt;
  }

  TagValues values;
  size_t group = 1;
  for (const auto& token : spec) {
    const auto* placeholder = std::get_if<PlaceholderToken>(&token);
    if (!placeholder) continue;

    const std::string captured = match[group++].str();
    if (field_spec(placeholder->field).type == ValueType::Integer) {
      auto number = parse_unsigned(captured);
      if (!number) return std::nullopt;
      values.numbers[placeholder->field] = *number;
    } else {
      values.text[placeholder->field] = captured;
    }
  }
  return values;
}
