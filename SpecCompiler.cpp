#include "SpecCompiler.hpp"

#include "utils.hpp"

namespace {

// Any printable ASCII character that is not alphanumeric may act as a
// placeholder's substitution character; '_' is allowed explicitly.
bool is_mode_character(char c) {
  if (c == '_') return true;
  if (c < 0x20 || c > 0x7e) return false;
  return !is_ascii_letter(c) && !is_ascii_digit(c);
}

void append_literal(CompiledSpec& tokens, std::string_view text) {
  if (text.empty()) return;
  if (!tokens.empty()) {
    if (auto* last = std::get_if<LiteralToken>(&tokens.back())) {
      last->text += text;
      return;
    }
  }
  tokens.push_back(LiteralToken{std::string(text)});
}

}  // namespace

CompiledSpec SpecCompiler::compile(std::string_view spec) {
  CompiledSpec tokens;
  size_t literal_start = 0;
  size_t pos = 0;

  while (pos < spec.size()) {
    if (spec[pos] != '%') {
      ++pos;
      continue;
    }

    std::optional<char> mode;
    size_t letter_pos = pos + 1;
    if (letter_pos + 1 < spec.size() && is_mode_character(spec[letter_pos]) &&
        is_ascii_letter(spec[letter_pos + 1])) {
      mode = spec[letter_pos];
      ++letter_pos;
    }
    if (letter_pos >= spec.size() || !is_ascii_letter(spec[letter_pos])) {
      // Not a placeholder; the percent sign stays literal.
      ++pos;
      continue;
    }

    const char letter = spec[letter_pos];
    const FieldSpec* field = find_field_by_code(letter);
    if (!field) {
      throw InvalidFieldError(letter, pos);
    }

    append_literal(tokens, spec.substr(literal_start, pos - literal_start));
    PlaceholderToken placeholder;
    placeholder.field = field->field;
    placeholder.substitution = mode;
    placeholder.case_mode = (letter >= 'A' && letter <= 'Z')
                                ? CaseMode::Preserve
                                : CaseMode::Downcase;
    tokens.push_back(placeholder);

    pos = letter_pos + 1;
    literal_start = pos;
  }
  append_literal(tokens, spec.substr(literal_start));
  return tokens;
}

std::string SpecCompiler::to_string(const CompiledSpec& spec) {
  std::string out;
  for (const auto& token : spec) {
    if (const auto* literal = std::get_if<LiteralToken>(&token)) {
      out += literal->text;
      continue;
    }
    const auto& placeholder = std::get<PlaceholderToken>(token);
    char code = field_spec(placeholder.field).code;
    if (placeholder.case_mode == CaseMode::Preserve) {
      code = static_cast<char>(code - ('a' - 'A'));
    }
    out += '%';
    if (placeholder.substitution) out += *placeholder.substitution;
    out += code;
  }
  return out;
}
