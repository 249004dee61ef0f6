#include <exception>
#include <print>
#include <string>
#include <vector>

#include "CommandLine.hpp"
#include "IOManager.hpp"
#include "TagEditor.hpp"
#include "TagLibFile.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

int argument_error(std::string_view program, std::string_view message) {
  IOManager::log(std::format("Argument error: {}", message));
  std::println(stderr, "{}: {}", program, message);
  std::println(stderr, "Try '{} --help' for more information.", program);
  return 2;
}

// An explicitly named config must load; otherwise the first readable file on
// the search path wins and a missing one means defaults.
Config resolve_config(const Options& options) {
  if (options.config_path) {
    auto config = IOManager::load_config(*options.config_path);
    if (!config) {
      throw ArgumentError(std::format("cannot load config file '{}'",
                                      safe_path_to_string(*options.config_path)));
    }
    return *config;
  }
  for (const auto& configPath : IOManager::config_search_paths()) {
    if (fs::exists(configPath)) {
      if (auto config = IOManager::load_config(configPath)) {
        return *config;
      }
    }
  }
  return Config{};
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string program =
      argc > 0 ? safe_path_to_string(fs::path(argv[0]).filename()) : "tagsmith";

  try {
    Options options;
    Config config;
    try {
      options = CommandLine::parse(argc, argv);
      if (options.show_help) {
        std::print("{}", CommandLine::usage(program));
        return 0;
      }
      if (options.show_version) {
        std::println("tagsmith {}", kTagsmithVersion);
        return 0;
      }
      if (options.files.empty() && !options.undo_path) {
        std::print(stderr, "{}", CommandLine::usage(program));
        return 2;
      }
      if (options.undo_path && !options.files.empty()) {
        throw ArgumentError("--undo cannot be combined with files");
      }
      config = resolve_config(options);
    } catch (const ArgumentError& e) {
      return argument_error(program, e.what());
    }

    IOManager::initialize_logger(
        options.log_path ? *options.log_path : fs::path(config.log_file));
    if (options.verbose || config.verbose) {
      IOManager::set_log_handler([](std::string_view line) {
        std::println(stderr, "{}", line);
      });
    }
    IOManager::log(std::format("--- tagsmith {} started ---", kTagsmithVersion));

    if (options.undo_path) {
      return IOManager::run_undo(*options.undo_path) ? 0 : 1;
    }

    std::optional<TagEditor> editor;
    try {
      editor.emplace(options, TagLibFile::open);
    } catch (const ArgumentError& e) {
      return argument_error(program, e.what());
    }
    const int status = editor->run();

    const fs::path journalPath = options.journal_path
                                     ? *options.journal_path
                                     : fs::path(config.journal_file);
    if (!journalPath.empty() && !options.dry_run) {
      IOManager::save_journal(journalPath, editor->journal());
    }

    IOManager::log(std::format("--- tagsmith exited with status {} ---", status));
    return status;

  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "{}: fatal error: {}", program, e.what());
    return 1;
  }
}
