#include "CommandLine.hpp"

#include <getopt.h>

#include <format>
#include <vector>

#include "utils.hpp"

namespace {

enum LongOnly : int {
  kOptClear = 256,
  kOptExtract,
  kOptRename,
  kOptRenameFs,
  kOptVersion,
  kOptJson,
  kOptDryRun,
  kOptConfig,
  kOptLog,
  kOptJournal,
  kOptUndo,
  // --no-<field> options follow, one per registry entry.
  kOptNoFieldBase = 512,
};

std::vector<std::string> no_field_names() {
  std::vector<std::string> names;
  for (const auto& spec : kFieldRegistry) {
    names.push_back(std::format("no-{}", spec.name));
  }
  return names;
}

FieldAction make_set_action(const FieldSpec& spec, const char* value) {
  if (spec.type == ValueType::Text) {
    return SetField{spec.field, std::string(value)};
  }
  auto number = parse_unsigned(value);
  if (!number) {
    throw ArgumentError(
        std::format("invalid {} '{}': expected a whole number", spec.name,
                    value));
  }
  return SetField{spec.field, *number};
}

}  // namespace

Options CommandLine::parse(int argc, char* argv[]) {
  // Field names live in kFieldRegistry, so the option table is built here
  // instead of being a static array.
  static const std::vector<std::string> no_names = no_field_names();
  std::vector<option> long_options;
  for (const auto& spec : kFieldRegistry) {
    long_options.push_back(
        {spec.name.data(), required_argument, nullptr, spec.code});
  }
  for (size_t i = 0; i < no_names.size(); ++i) {
    long_options.push_back({no_names[i].c_str(), no_argument, nullptr,
                            kOptNoFieldBase + static_cast<int>(i)});
  }
  long_options.insert(
      long_options.end(),
      {{"clear", no_argument, nullptr, kOptClear},
       {"extract", required_argument, nullptr, kOptExtract},
       {"rename", required_argument, nullptr, kOptRename},
       {"rename-fs", required_argument, nullptr, kOptRenameFs},
       {"json", no_argument, nullptr, kOptJson},
       {"dry-run", no_argument, nullptr, kOptDryRun},
       {"config", required_argument, nullptr, kOptConfig},
       {"log", required_argument, nullptr, kOptLog},
       {"journal", required_argument, nullptr, kOptJournal},
       {"undo", required_argument, nullptr, kOptUndo},
       {"verbose", no_argument, nullptr, 'v'},
       {"help", no_argument, nullptr, 'h'},
       {"version", no_argument, nullptr, kOptVersion},
       {nullptr, 0, nullptr, 0}});

  std::string short_options;
  for (const auto& spec : kFieldRegistry) {
    short_options += spec.code;
    short_options += ':';
  }
  short_options += "hv";

  Options options;
  // Reset getopt so parse() can run more than once per process.
  optind = 0;
  int opt;
  while ((opt = getopt_long(argc, argv, short_options.c_str(),
                            long_options.data(), nullptr)) != -1) {
    if (const FieldSpec* spec = find_field_by_code(static_cast<char>(opt));
        spec && opt == spec->code) {
      options.actions.push_back(make_set_action(*spec, optarg));
      continue;
    }
    if (opt >= kOptNoFieldBase &&
        opt < kOptNoFieldBase + static_cast<int>(kFieldRegistry.size())) {
      options.actions.push_back(
          ClearField{kFieldRegistry[opt - kOptNoFieldBase].field});
      continue;
    }
    switch (opt) {
      case kOptClear:
        for (const auto& spec : kFieldRegistry) {
          options.actions.push_back(ClearField{spec.field});
        }
        break;
      case kOptExtract:
        options.extract_spec = optarg;
        break;
      case kOptRename:
        options.rename_spec = optarg;
        options.rename_mode = SanitizeMode::Shell;
        break;
      case kOptRenameFs:
        options.rename_spec = optarg;
        options.rename_mode = SanitizeMode::Filesystem;
        break;
      case kOptJson:
        options.json_output = true;
        break;
      case kOptDryRun:
        options.dry_run = true;
        break;
      case kOptConfig:
        options.config_path = optarg;
        break;
      case kOptLog:
        options.log_path = optarg;
        break;
      case kOptJournal:
        options.journal_path = optarg;
        break;
      case kOptUndo:
        options.undo_path = optarg;
        break;
      case 'v':
        options.verbose = true;
        break;
      case 'h':
        options.show_help = true;
        break;
      case kOptVersion:
        options.show_version = true;
        break;
      default:
        // getopt_long already printed the reason.
        throw ArgumentError("invalid command line");
    }
  }

  for (int i = optind; i < argc; ++i) {
    options.files.push_back(argv[i]);
  }
  return options;
}

std::string CommandLine::usage(std::string_view program) {
  std::string text = std::format("usage: {} [options] FILE...\n\n", program);
  text += "Without edit, extract or rename options, prints each file's tags.\n\n";
  text += "Field options:\n";
  for (const auto& spec : kFieldRegistry) {
    text += std::format("  -{}, --{:<9} {:<7} set the {}\n", spec.code,
                        spec.name,
                        spec.type == ValueType::Integer ? "NUMBER" : "TEXT",
                        spec.name);
  }
  for (const auto& spec : kFieldRegistry) {
    text += std::format("      --no-{:<14} remove the {}\n", spec.name,
                        spec.name);
  }
  text +=
      "      --clear              remove every field above\n"
      "\n"
      "Template options:\n"
      "      --extract SPEC       set fields from the file name\n"
      "      --rename SPEC        rename from fields, shell-safe characters\n"
      "      --rename-fs SPEC     rename from fields, filesystem-safe "
      "characters\n"
      "  SPEC placeholders are %<letter> using the field letters above, e.g.\n"
      "  \"%n - %t\". Lowercase letters lowercase the value, uppercase keep it;\n"
      "  only ASCII letters A-Z are lowercased, other letters keep their case.\n"
      "  A punctuation character or '_' after '%' (\"%_t\") replaces unsafe\n"
      "  characters in the value.\n"
      "\n"
      "Other options:\n"
      "      --json               print tags as JSON\n"
      "      --dry-run            report changes without saving or renaming\n"
      "      --journal FILE       record renames to FILE\n"
      "      --undo FILE          revert the renames recorded in FILE\n"
      "      --config FILE        read configuration from FILE\n"
      "      --log FILE           append a log to FILE\n"
      "  -v, --verbose            echo log messages to stderr\n"
      "  -h, --help               show this help\n"
      "      --version            show the version\n";
  return text;
}
