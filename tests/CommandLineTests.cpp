#include <gtest/gtest.h>

#include <format>
#include <string>
#include <vector>

#include "../CommandLine.hpp"

namespace {

// getopt_long wants mutable argv, so the strings are owned here.
class Argv {
 public:
  Argv(std::initializer_list<std::string> args) : m_storage(args) {
    for (auto& arg : m_storage) m_pointers.push_back(arg.data());
    m_pointers.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(m_storage.size()); }
  char** argv() { return m_pointers.data(); }

 private:
  std::vector<std::string> m_storage;
  std::vector<char*> m_pointers;
};

Options Parse(std::initializer_list<std::string> args) {
  Argv argv(args);
  return CommandLine::parse(argv.argc(), argv.argv());
}

}  // namespace

TEST(CommandLineTest, CollectsFieldActionsInOrder) {
  Options options =
      Parse({"tagsmith", "-t", "Jóga", "--artist", "Björk", "--no-comment",
             "-n", "3", "song.mp3"});

  ASSERT_EQ(options.actions.size(), 4);
  const auto& title = std::get<SetField>(options.actions[0]);
  EXPECT_EQ(title.field, Field::Title);
  EXPECT_EQ(std::get<std::string>(title.value), "Jóga");
  EXPECT_EQ(std::get<SetField>(options.actions[1]).field, Field::Artist);
  EXPECT_EQ(std::get<ClearField>(options.actions[2]).field, Field::Comment);
  const auto& track = std::get<SetField>(options.actions[3]);
  EXPECT_EQ(std::get<unsigned int>(track.value), 3u);

  ASSERT_EQ(options.files.size(), 1);
  EXPECT_EQ(options.files[0], "song.mp3");
}

TEST(CommandLineTest, ClearExpandsToEveryField) {
  Options options = Parse({"tagsmith", "--clear", "--year", "1997", "a.ogg"});

  ASSERT_EQ(options.actions.size(), kFieldRegistry.size() + 1);
  for (size_t i = 0; i < kFieldRegistry.size(); ++i) {
    EXPECT_EQ(std::get<ClearField>(options.actions[i]).field,
              kFieldRegistry[i].field);
  }
  EXPECT_EQ(std::get<unsigned int>(
                std::get<SetField>(options.actions.back()).value),
            1997u);
}

TEST(CommandLineTest, MalformedIntegerIsAnArgumentError) {
  EXPECT_THROW(Parse({"tagsmith", "--track", "3a", "x.mp3"}), ArgumentError);
  EXPECT_THROW(Parse({"tagsmith", "-y", "-1", "x.mp3"}), ArgumentError);
  EXPECT_THROW(Parse({"tagsmith", "-y", "", "x.mp3"}), ArgumentError);
}

TEST(CommandLineTest, UnknownOptionIsAnArgumentError) {
  EXPECT_THROW(Parse({"tagsmith", "--bogus", "x.mp3"}), ArgumentError);
  EXPECT_THROW(Parse({"tagsmith", "--extract"}), ArgumentError);
}

TEST(CommandLineTest, RenameFlagsSelectSanitizeMode) {
  Options shell = Parse({"tagsmith", "--rename", "%n %t", "a.mp3"});
  ASSERT_TRUE(shell.rename_spec.has_value());
  EXPECT_EQ(*shell.rename_spec, "%n %t");
  EXPECT_EQ(shell.rename_mode, SanitizeMode::Shell);

  Options fs_mode = Parse({"tagsmith", "--rename-fs", "%T", "a.mp3"});
  EXPECT_EQ(fs_mode.rename_mode, SanitizeMode::Filesystem);
}

TEST(CommandLineTest, ExtractAndRenameMayBeCombined) {
  Options options = Parse(
      {"tagsmith", "--extract", "%r - %t", "--rename", "%_T", "a.mp3", "b.mp3"});

  EXPECT_EQ(*options.extract_spec, "%r - %t");
  EXPECT_EQ(*options.rename_spec, "%_T");
  EXPECT_EQ(options.files.size(), 2);
}

TEST(CommandLineTest, InformationalAndAmbientFlags) {
  Options options =
      Parse({"tagsmith", "--help", "--version", "-v", "--json", "--dry-run",
             "--log", "t.log", "--journal", "j.json", "--config", "c.json"});

  EXPECT_TRUE(options.show_help);
  EXPECT_TRUE(options.show_version);
  EXPECT_TRUE(options.verbose);
  EXPECT_TRUE(options.json_output);
  EXPECT_TRUE(options.dry_run);
  EXPECT_EQ(*options.log_path, "t.log");
  EXPECT_EQ(*options.journal_path, "j.json");
  EXPECT_EQ(*options.config_path, "c.json");
  EXPECT_TRUE(options.files.empty());
}

TEST(CommandLineTest, ParsingCanRepeat) {
  Parse({"tagsmith", "-t", "one", "a.mp3"});
  Options second = Parse({"tagsmith", "-g", "trip-hop", "b.mp3"});

  ASSERT_EQ(second.actions.size(), 1);
  EXPECT_EQ(std::get<SetField>(second.actions[0]).field, Field::Genre);
  EXPECT_EQ(second.files[0], "b.mp3");
}

TEST(CommandLineTest, UsageListsEveryField) {
  const std::string text = CommandLine::usage("tagsmith");
  for (const auto& spec : kFieldRegistry) {
    EXPECT_NE(text.find(std::format("--{}", spec.name)), std::string::npos);
    EXPECT_NE(text.find(std::format("--no-{}", spec.name)), std::string::npos);
  }
}

TEST(CommandLineTest, UsageSaysLowercasingIsAsciiOnly) {
  const std::string text = CommandLine::usage("tagsmith");
  EXPECT_NE(text.find("only ASCII letters A-Z are lowercased"),
            std::string::npos);
}
