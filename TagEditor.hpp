#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "Sanitizer.hpp"
#include "TagAccessor.hpp"
#include "types.hpp"

// Formats one file's populated fields for print mode: the path, then one
// "  name:    value" line per non-empty field.
std::string format_fields(const fs::path& path, const TagValues& values);
json fields_to_json(const fs::path& path, const TagValues& values);

class TagEditor {
 public:
  using Opener =
      std::function<std::unique_ptr<TagAccessor>(const fs::path& path)>;

  // Compiles the extract and rename templates; throws InvalidFieldError if
  // either names an unknown field.
  TagEditor(const Options& options, Opener opener);

  // Processes every file in order and returns the exit status: 0 when all
  // files succeeded, 1 when any failed. A failure never stops the batch.
  int run();

  const std::vector<JournalEntry>& journal() const { return m_journal; }

 private:
  bool process_file(const fs::path& path);
  bool save(TagAccessor& file, const fs::path& path);
  bool rename_file(const fs::path& from, const fs::path& to);
  bool target_taken(const fs::path& to) const;
  void report(const fs::path& path, FileError error);
  bool print_mode() const;

  const Options m_options;
  Opener m_opener;
  std::optional<CompiledSpec> m_extract;
  std::optional<std::regex> m_extract_pattern;
  std::optional<CompiledSpec> m_rename;
  const Sanitizer::DangerousClass& m_dangerous;

  json m_json_output = json::array();
  std::vector<JournalEntry> m_journal;
  // Dry runs touch nothing on disk, so the names earlier files would have
  // taken and freed are tracked here.
  std::set<fs::path> m_claimed_targets;
  std::set<fs::path> m_vacated_sources;
};
