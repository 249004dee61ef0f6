#include "TagAccessor.hpp"

#include "utils.hpp"

TagValues TagAccessor::values() const {
  TagValues result;
  for (const auto& spec : kFieldRegistry) {
    if (spec.type == ValueType::Text) {
      result.text[spec.field] = text(spec.field);
    } else {
      result.numbers[spec.field] = number(spec.field);
    }
  }
  return result;
}

void TagAccessor::apply(const TagValues& values) {
  for (const auto& [field, value] : values.text) {
    set_text(field, value);
  }
  for (const auto& [field, value] : values.numbers) {
    set_number(field, value);
  }
}

void TagAccessor::clear(Field field) {
  if (field_spec(field).type == ValueType::Text) {
    set_text(field, std::string());
  } else {
    set_number(field, 0);
  }
}

void TagAccessor::apply(const FieldAction& action) {
  if (const auto* clear_action = std::get_if<ClearField>(&action)) {
    clear(clear_action->field);
    return;
  }
  const auto& set = std::get<SetField>(action);
  if (const auto* number_value = std::get_if<unsigned int>(&set.value)) {
    set_number(set.field, *number_value);
  } else {
    set_text(set.field, std::get<std::string>(set.value));
  }
}
