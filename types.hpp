#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

inline constexpr std::string_view kTagsmithVersion = "1.0.0";

enum class Field { Album, Artist, Comment, Genre, Title, Track, Year };
enum class ValueType { Text, Integer };

struct FieldSpec {
  Field field;
  char code;
  std::string_view name;
  ValueType type;
};

// Registry order is significant: rendering walks it, and print mode lists
// fields in it.
inline constexpr std::array<FieldSpec, 7> kFieldRegistry = {{
    {Field::Album, 'l', "album", ValueType::Text},
    {Field::Artist, 'r', "artist", ValueType::Text},
    {Field::Comment, 'c', "comment", ValueType::Text},
    {Field::Genre, 'g', "genre", ValueType::Text},
    {Field::Title, 't', "title", ValueType::Text},
    {Field::Track, 'n', "track", ValueType::Integer},
    {Field::Year, 'y', "year", ValueType::Integer},
}};

enum class CaseMode { Preserve, Downcase };

struct LiteralToken {
  std::string text;
};

struct PlaceholderToken {
  Field field;
  std::optional<char> substitution;
  CaseMode case_mode = CaseMode::Downcase;
};

using SpecToken = std::variant<LiteralToken, PlaceholderToken>;
using CompiledSpec = std::vector<SpecToken>;

// Field values detached from any file. Text fields are absent when empty,
// Integer fields when zero.
struct TagValues {
  std::unordered_map<Field, std::string> text;
  std::unordered_map<Field, unsigned int> numbers;
};

struct SetField {
  Field field;
  std::variant<std::string, unsigned int> value;
};

struct ClearField {
  Field field;
};

using FieldAction = std::variant<SetField, ClearField>;

enum class SanitizeMode { None, Shell, Filesystem };

enum class FileError {
  OpenFailed,
  ExtractionMismatch,
  SaveRefused,
  SaveFailed,
  RenameCollision,
  RenameFailed
};

class ArgumentError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidFieldError : public ArgumentError {
 public:
  InvalidFieldError(char code, std::size_t position)
      : ArgumentError(std::string("unknown field placeholder '%") + code +
                      "' at position " + std::to_string(position)),
        m_code(code) {}

  char code() const { return m_code; }

 private:
  char m_code;
};

struct Options {
  std::vector<FieldAction> actions;
  std::optional<std::string> extract_spec;
  std::optional<std::string> rename_spec;
  SanitizeMode rename_mode = SanitizeMode::Shell;
  bool json_output = false;
  bool dry_run = false;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
  std::optional<fs::path> config_path;
  std::optional<fs::path> log_path;
  std::optional<fs::path> journal_path;
  std::optional<fs::path> undo_path;
  std::vector<fs::path> files;
};

struct Config {
  std::string log_file;
  bool verbose = false;
  std::string journal_file;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_file, verbose,
                                                journal_file);

enum class ActionType { RENAME };
NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {{ActionType::RENAME, "RENAME"}});
struct JournalEntry {
  ActionType action;
  fs::path from;
  fs::path to;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(JournalEntry, action, from, to);
