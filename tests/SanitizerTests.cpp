#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../Sanitizer.hpp"

using Sanitizer::filesystem_unsafe;
using Sanitizer::no_dangerous_characters;
using Sanitizer::sanitize;
using Sanitizer::shell_unsafe;

TEST(SanitizerTest, FilesystemModeCollapsesColonAndSlash) {
  EXPECT_EQ(sanitize("AC/DC: Live!", "_", filesystem_unsafe()), "AC_DC_Live!");
}

TEST(SanitizerTest, ShellModeReplacesMetacharacters) {
  EXPECT_EQ(sanitize("Rock & Roll (Live)", "_", shell_unsafe()),
            "Rock_Roll_Live");
  EXPECT_EQ(sanitize("what?!", "-", shell_unsafe()), "what");
}

// Apostrophes disappear instead of becoming a substitute character.
TEST(SanitizerTest, RemovesApostrophesInEveryMode) {
  EXPECT_EQ(sanitize("Don't Stop", "_", shell_unsafe()), "Dont_Stop");
  EXPECT_EQ(sanitize("Rock'n'Roll", "_", no_dangerous_characters()),
            "RocknRoll");
}

TEST(SanitizerTest, EmptySubstituteRemovesDangerousRuns) {
  EXPECT_EQ(sanitize("glory box", "", shell_unsafe()), "glorybox");
}

TEST(SanitizerTest, CollapsesExistingSubstituteRuns) {
  EXPECT_EQ(sanitize("a__b", "_", no_dangerous_characters()), "a_b");
  EXPECT_EQ(sanitize("_lead and trail_", "_", shell_unsafe()),
            "lead_and_trail");
}

TEST(SanitizerTest, DegenerateInputFallsBackToUnderscore) {
  EXPECT_EQ(sanitize("", "_", shell_unsafe()), "_");
  EXPECT_EQ(sanitize("'''", "-", shell_unsafe()), "_");
  EXPECT_EQ(sanitize("?*?", "_", filesystem_unsafe()), "_");
}

TEST(SanitizerTest, NoneModeKeepsUnicodeAndPunctuation) {
  EXPECT_EQ(sanitize("Björk: Homogenic", "", no_dangerous_characters()),
            "Björk: Homogenic");
}

class SanitizerPropertyTest : public ::testing::Test {
 protected:
  const std::vector<std::string> inputs = {
      "AC/DC: Live!",    "  spaced  out  ", "__x__",       "a - b - c",
      "Rock'n'Roll",     "$HOME/`pwd`",     "Björk / Jóga", "tab\tand\nnewline",
      "***",             "plain",           "-dash-",      "Sigur Rós (()) ",
  };
  const std::vector<std::string> substitutes = {"_", "-", ".", ""};
  const std::vector<const Sanitizer::DangerousClass*> classes = {
      &shell_unsafe(), &filesystem_unsafe(), &no_dangerous_characters()};
};

TEST_F(SanitizerPropertyTest, IsIdempotent) {
  for (const auto* cls : classes) {
    for (const auto& sub : substitutes) {
      for (const auto& input : inputs) {
        const std::string once = sanitize(input, sub, *cls);
        EXPECT_EQ(sanitize(once, sub, *cls), once)
            << "input '" << input << "' substitute '" << sub << "'";
      }
    }
  }
}

TEST_F(SanitizerPropertyTest, NeverLeavesEdgeOrDoubledSubstitutes) {
  for (const auto* cls : classes) {
    for (const auto& sub : substitutes) {
      if (sub.empty()) continue;
      for (const auto& input : inputs) {
        const std::string out = sanitize(input, sub, *cls);
        if (out == "_") continue;  // degenerate-input fallback
        EXPECT_FALSE(out.starts_with(sub)) << out;
        EXPECT_FALSE(out.ends_with(sub)) << out;
        EXPECT_EQ(out.find(sub + sub), std::string::npos) << out;
      }
    }
  }
}
