#pragma once

#include <memory>
#include <taglib/fileref.h>

#include "TagAccessor.hpp"

// TagAccessor backed by a TagLib::FileRef. The file stays open for the
// lifetime of the object.
class TagLibFile : public TagAccessor {
  // Only open() can name this, so only open() can construct.
  struct Passkey {
    explicit Passkey() = default;
  };

 public:
  // Returns nullptr when TagLib cannot open the file or finds no tag.
  static std::unique_ptr<TagAccessor> open(const fs::path& path);

  std::string text(Field field) const override;
  unsigned int number(Field field) const override;
  void set_text(Field field, const std::string& value) override;
  void set_number(Field field, unsigned int value) override;
  SaveResult save() override;

  TagLibFile(Passkey, TagLib::FileRef file, const fs::path& path);
  TagLibFile(const TagLibFile&) = delete;
  TagLibFile& operator=(const TagLibFile&) = delete;

 private:
  TagLib::FileRef m_file;
  const fs::path m_path;
};
