#include "TagLibFile.hpp"

#include <taglib/mp4file.h>
#include <taglib/tag.h>
#include <taglib/tstring.h>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {

TagLib::String to_taglib(const std::string& value) {
  return TagLib::String(value, TagLib::String::UTF8);
}

}  // namespace

std::unique_ptr<TagAccessor> TagLibFile::open(const fs::path& path) {
  TagLib::FileRef file(path.c_str());
  if (file.isNull() || !file.tag()) {
    IOManager::log(std::format("TagLib could not open '{}'",
                               safe_path_to_string(path)));
    return nullptr;
  }
  return std::make_unique<TagLibFile>(Passkey{}, file, path);
}

TagLibFile::TagLibFile(Passkey, TagLib::FileRef file, const fs::path& path)
    : m_file(file), m_path(path) {}

std::string TagLibFile::text(Field field) const {
  const TagLib::Tag* tag = m_file.tag();
  switch (field) {
    case Field::Album:
      return tag->album().to8Bit(true);
    case Field::Artist:
      return tag->artist().to8Bit(true);
    case Field::Comment:
      return tag->comment().to8Bit(true);
    case Field::Genre:
      return tag->genre().to8Bit(true);
    case Field::Title:
      return tag->title().to8Bit(true);
    case Field::Track:
    case Field::Year:
      break;
  }
  throw std::logic_error("text() called for an integer field");
}

unsigned int TagLibFile::number(Field field) const {
  const TagLib::Tag* tag = m_file.tag();
  switch (field) {
    case Field::Track:
      return tag->track();
    case Field::Year:
      return tag->year();
    default:
      break;
  }
  throw std::logic_error("number() called for a text field");
}

void TagLibFile::set_text(Field field, const std::string& value) {
  TagLib::Tag* tag = m_file.tag();
  switch (field) {
    case Field::Album:
      tag->setAlbum(to_taglib(value));
      return;
    case Field::Artist:
      tag->setArtist(to_taglib(value));
      return;
    case Field::Comment:
      tag->setComment(to_taglib(value));
      return;
    case Field::Genre:
      tag->setGenre(to_taglib(value));
      return;
    case Field::Title:
      tag->setTitle(to_taglib(value));
      return;
    case Field::Track:
    case Field::Year:
      break;
  }
  throw std::logic_error("set_text() called for an integer field");
}

void TagLibFile::set_number(Field field, unsigned int value) {
  TagLib::Tag* tag = m_file.tag();
  switch (field) {
    case Field::Track:
      tag->setTrack(value);
      return;
    case Field::Year:
      tag->setYear(value);
      return;
    default:
      break;
  }
  throw std::logic_error("set_number() called for a text field");
}

SaveResult TagLibFile::save() {
  // TagLib's MP4 writer has corrupted files in the wild; never attempt it.
  if (dynamic_cast<TagLib::MP4::File*>(m_file.file()) != nullptr) {
    IOManager::log(std::format("Refusing to save MP4 container '{}'",
                               safe_path_to_string(m_path)));
    return SaveResult::Refused;
  }
  if (!m_file.save()) {
    IOManager::log(
        std::format("TagLib failed to save '{}'", safe_path_to_string(m_path)));
    return SaveResult::Failed;
  }
  return SaveResult::Saved;
}
