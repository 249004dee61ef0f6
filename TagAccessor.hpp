#pragma once

#include <string>

#include "types.hpp"

enum class SaveResult { Saved, Refused, Failed };

// Typed get/set access to the registry fields of one open media file.
// Text fields use empty strings for "absent", Integer fields use zero.
class TagAccessor {
 public:
  virtual ~TagAccessor() = default;

  virtual std::string text(Field field) const = 0;
  virtual unsigned int number(Field field) const = 0;
  virtual void set_text(Field field, const std::string& value) = 0;
  virtual void set_number(Field field, unsigned int value) = 0;
  virtual SaveResult save() = 0;

  TagValues values() const;
  void apply(const TagValues& values);
  void apply(const FieldAction& action);
  void clear(Field field);
};
