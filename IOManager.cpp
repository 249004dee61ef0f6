#include "IOManager.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <mutex>

#include "utils.hpp"

namespace {
std::ofstream g_log_stream;

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

}  // namespace

void IOManager::initialize_logger(const fs::path& logPath) {
  std::scoped_lock lock(log_mutex);
  if (g_log_stream.is_open()) g_log_stream.close();
  if (logPath.empty()) return;
  g_log_stream.open(logPath, std::ios_base::app);
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  if (g_log_stream.is_open()) {
    g_log_stream << full_message << "\n" << std::flush;
  }
}

std::vector<fs::path> IOManager::config_search_paths() {
  std::vector<fs::path> paths;
  const char* xdg_config_home = getenv("XDG_CONFIG_HOME");
  if (xdg_config_home && *xdg_config_home) {
    paths.push_back(fs::path(xdg_config_home) / "tagsmith" / "config.json");
  } else if (const char* home_dir = getenv("HOME"); home_dir && *home_dir) {
    paths.push_back(fs::path(home_dir) / ".config" / "tagsmith" /
                    "config.json");
  }
  paths.push_back(fs::current_path() / "tagsmith.json");
  return paths;
}

std::optional<Config> IOManager::load_config(const fs::path& configPath) {
  if (!fs::exists(configPath)) {
    log(std::format("Config file not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    json configJson = json::parse(configFile);
    return configJson.get<Config>();
  } catch (const json::exception& e) {
    log(std::format("Error parsing {}: {}", safe_path_to_string(configPath),
                    e.what()));
    return std::nullopt;
  }
}

bool IOManager::run_undo(const fs::path& journalPath) {
  if (!fs::exists(journalPath)) {
    log("No journal file found. Nothing to undo.");
    return false;
  }
  std::vector<JournalEntry> journal;
  try {
    std::ifstream journalFile(journalPath);
    journal = json::parse(journalFile).get<std::vector<JournalEntry>>();
  } catch (const json::exception& e) {
    log(std::format("Error reading journal {}: {}",
                    safe_path_to_string(journalPath), e.what()));
    return false;
  }
  log(std::format("Undoing {} renames from {}", journal.size(),
                  safe_path_to_string(journalPath)));
  // Entries that could not be reverted stay in the journal, in their
  // original order, so a later undo can retry them.
  std::vector<JournalEntry> remaining;
  for (auto it = journal.rbegin(); it != journal.rend(); ++it) {
    const JournalEntry& entry = *it;
    if (entry.action != ActionType::RENAME) continue;
    if (!fs::exists(entry.to)) {
      log(std::format("   Skipping '{}': file no longer exists",
                      safe_path_to_string(entry.to)));
      remaining.push_back(entry);
      continue;
    }
    if (fs::exists(entry.from)) {
      log(std::format("   Skipping '{}': '{}' is occupied",
                      safe_path_to_string(entry.to),
                      safe_path_to_string(entry.from)));
      remaining.push_back(entry);
      continue;
    }
    log(std::format("Undoing rename: '{}' -> '{}'",
                    safe_path_to_string(entry.to),
                    safe_path_to_string(entry.from)));
    std::error_code ec;
    fs::rename(entry.to, entry.from, ec);
    if (ec) {
      log(std::format("   Error undoing rename: {}", ec.message()));
      remaining.push_back(entry);
    }
  }
  std::reverse(remaining.begin(), remaining.end());

  if (remaining.empty()) {
    std::error_code ec;
    fs::remove(journalPath, ec);
    if (ec) {
      log(std::format("Undo complete, but the journal could not be removed: {}",
                      ec.message()));
      return false;
    }
    log("Undo complete. Journal file removed.");
    return true;
  }
  save_journal(journalPath, remaining);
  log(std::format("Undo finished with errors. {} entries kept in the journal.",
                  remaining.size()));
  return false;
}

void IOManager::save_journal(const fs::path& journalPath,
                             const std::vector<JournalEntry>& journal) {
  if (!journal.empty()) {
    std::ofstream j_file(journalPath);
    j_file << json(journal).dump(2);
    log(std::format("Journal saved with {} renames to {}", journal.size(),
                    safe_path_to_string(journalPath)));
  }
}
