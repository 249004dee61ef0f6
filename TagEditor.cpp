#include "TagEditor.hpp"

#include <print>
#include <utility>

#include "Extractor.hpp"
#include "IOManager.hpp"
#include "Renderer.hpp"
#include "SpecCompiler.hpp"
#include "utils.hpp"

namespace {
// Column at which print mode starts field values.
constexpr int kValueColumn = 11;
}  // namespace

std::string format_fields(const fs::path& path, const TagValues& values) {
  std::string out = safe_path_to_string(path) + "\n";
  for (const auto& spec : kFieldRegistry) {
    const std::string value = field_text(values, spec, TrackStyle::Plain);
    if (value.empty()) continue;
    out += std::format("  {:<{}}{}\n", std::format("{}:", spec.name),
                       kValueColumn - 2, value);
  }
  return out;
}

json fields_to_json(const fs::path& path, const TagValues& values) {
  json entry;
  entry["file"] = safe_path_to_string(path);
  for (const auto& spec : kFieldRegistry) {
    if (spec.type == ValueType::Text) {
      auto it = values.text.find(spec.field);
      if (it != values.text.end() && !it->second.empty()) {
        entry[std::string(spec.name)] = it->second;
      }
    } else {
      auto it = values.numbers.find(spec.field);
      if (it != values.numbers.end() && it->second != 0) {
        entry[std::string(spec.name)] = it->second;
      }
    }
  }
  return entry;
}

TagEditor::TagEditor(const Options& options, Opener opener)
    : m_options(options),
      m_opener(std::move(opener)),
      m_dangerous(Sanitizer::class_for(options.rename_mode)) {
  if (m_options.extract_spec) {
    m_extract = SpecCompiler::compile(*m_options.extract_spec);
    m_extract_pattern = Extractor::compile_pattern(*m_extract);
    IOManager::log(std::format("Extract template: {}",
                               SpecCompiler::to_string(*m_extract)));
  }
  if (m_options.rename_spec) {
    m_rename = SpecCompiler::compile(*m_options.rename_spec);
    IOManager::log(std::format("Rename template: {}",
                               SpecCompiler::to_string(*m_rename)));
  }
}

bool TagEditor::print_mode() const {
  return !m_extract && !m_rename && m_options.actions.empty();
}

int TagEditor::run() {
  IOManager::log(std::format("Processing {} files...", m_options.files.size()));

  bool all_ok = true;
  for (const auto& path : m_options.files) {
    if (!process_file(path)) {
      all_ok = false;
    }
  }

  if (print_mode() && m_options.json_output) {
    std::println("{}", m_json_output.dump(2));
  }

  IOManager::log(all_ok ? "All files processed successfully."
                        : "Finished with errors.");
  return all_ok ? 0 : 1;
}

bool TagEditor::process_file(const fs::path& path) {
  auto file = m_opener(path);
  if (!file) {
    report(path, FileError::OpenFailed);
    return false;
  }

  if (print_mode()) {
    if (m_options.json_output) {
      m_json_output.push_back(fields_to_json(path, file->values()));
    } else {
      std::print("{}", format_fields(path, file->values()));
    }
    return true;
  }

  bool ok = true;
  if (m_extract) {
    auto values = Extractor::extract(*m_extract, *m_extract_pattern,
                                     safe_path_to_string(path.stem()));
    if (!values) {
      report(path, FileError::ExtractionMismatch);
      ok = false;
    } else {
      file->apply(*values);
      IOManager::log(std::format("Extracted tags from '{}'",
                                 safe_path_to_string(path)));
      if (!save(*file, path)) ok = false;
    }
  }

  if (!m_options.actions.empty()) {
    for (const auto& action : m_options.actions) {
      file->apply(action);
    }
    if (!save(*file, path)) ok = false;
  }

  if (m_rename) {
    const std::string stem =
        Renderer::render(*m_rename, file->values(), m_dangerous);
    const fs::path target =
        path.parent_path() /
        utf8_to_path(stem + safe_path_to_string(path.extension()));
    // Close the file before its directory entry changes.
    file.reset();
    if (!rename_file(path, target)) ok = false;
  }
  return ok;
}

bool TagEditor::save(TagAccessor& file, const fs::path& path) {
  if (m_options.dry_run) {
    IOManager::log(
        std::format("Dry run: not saving '{}'", safe_path_to_string(path)));
    return true;
  }
  switch (file.save()) {
    case SaveResult::Saved:
      IOManager::log(std::format("Saved '{}'", safe_path_to_string(path)));
      return true;
    case SaveResult::Refused:
      report(path, FileError::SaveRefused);
      return false;
    case SaveResult::Failed:
      report(path, FileError::SaveFailed);
      return false;
  }
  return false;
}

bool TagEditor::rename_file(const fs::path& from, const fs::path& to) {
  if (to == from) {
    IOManager::log(
        std::format("'{}' already has its target name", safe_path_to_string(from)));
    return true;
  }

  // Check-then-act: another process may still create `to` before the rename.
  if (target_taken(to)) {
    report(to, FileError::RenameCollision);
    return false;
  }

  if (m_options.dry_run) {
    std::println("{} -> {} (dry run)", safe_path_to_string(from),
                 safe_path_to_string(to));
    m_claimed_targets.insert(to);
    m_vacated_sources.insert(from);
    return true;
  }

  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec) {
    IOManager::log(std::format("Rename '{}' -> '{}' failed: {}",
                               safe_path_to_string(from),
                               safe_path_to_string(to), ec.message()));
    report(from, FileError::RenameFailed);
    return false;
  }
  IOManager::log(std::format("Renamed '{}' -> '{}'", safe_path_to_string(from),
                             safe_path_to_string(to)));
  m_journal.push_back({ActionType::RENAME, from, to});
  return true;
}

bool TagEditor::target_taken(const fs::path& to) const {
  if (m_claimed_targets.contains(to)) return true;
  std::error_code ec;
  return fs::exists(to, ec) && !m_vacated_sources.contains(to);
}

void TagEditor::report(const fs::path& path, FileError error) {
  const std::string message =
      std::format("{}: {}", safe_path_to_string(path), describe(error));
  std::println(stderr, "{}", message);
  IOManager::log(std::format("Error: {}", message));
}
