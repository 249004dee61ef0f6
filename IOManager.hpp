#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace IOManager {
// Opens `logPath` for appending. An empty path keeps file logging off.
void initialize_logger(const fs::path& logPath);

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);

// Candidate config files in lookup order: $XDG_CONFIG_HOME/tagsmith (or
// ~/.config/tagsmith), then ./tagsmith.json.
std::vector<fs::path> config_search_paths();
std::optional<Config> load_config(const fs::path& configPath);

// Returns false when any journal entry could not be reverted.
bool run_undo(const fs::path& journalPath);
void save_journal(const fs::path& journalPath,
                  const std::vector<JournalEntry>& journal);
}  // namespace IOManager
