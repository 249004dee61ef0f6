#include "Renderer.hpp"

#include <vector>

#include "utils.hpp"

std::string Renderer::render(const CompiledSpec& spec, const TagValues& values,
                             const Sanitizer::DangerousClass& dangerous) {
  std::vector<std::string> slots(spec.size());

  // One pass per field, in registry order. Each occurrence is substituted on
  // its own, so one field may appear with different substitution characters.
  for (const auto& field : kFieldRegistry) {
    const std::string value = field_text(values, field);
    for (size_t i = 0; i < spec.size(); ++i) {
      const auto* placeholder = std::get_if<PlaceholderToken>(&spec[i]);
      if (!placeholder || placeholder->field != field.field) continue;

      const std::string cased = placeholder->case_mode == CaseMode::Downcase
                                    ? string_to_lower_ascii(value)
                                    : value;
      const std::string substitute =
          placeholder->substitution
              ? std::string(1, *placeholder->substitution)
              : std::string();
      slots[i] = Sanitizer::sanitize(cased, substitute, dangerous);
    }
  }

  std::string out;
  for (size_t i = 0; i < spec.size(); ++i) {
    if (const auto* literal = std::get_if<LiteralToken>(&spec[i])) {
      out += literal->text;
    } else {
      out += slots[i];
    }
  }
  return out;
}
