#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_directory.h"

namespace review {
namespace {

using ::testing::HasSubstr;

const char kSampleDiff[] = "diff --git a/src/user.ts b/src/user.ts\n"
                           "index 1111111..2222222 100644\n"
                           "--- a/src/user.ts\n"
                           "+++ b/src/user.ts\n"
                           "@@ -1,2 +1,3 @@\n"
                           " export function name(user) {\n"
                           "+  return user.profile.name;\n"
                           "-  return user.name;\n";

const char kStageOutput[] =
    R"([{"type": "error", "severity": "high", "category": "Null Check",
  "message": "profile may be undefined", "file": "src/user.ts", "line": 2,
  "suggestion": "use optional chaining"}])";

std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

std::filesystem::path ExecutableUnderTest() {
  return std::filesystem::path(DIFF_REVIEW_EXECUTABLE);
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system((command + " > /dev/null 2>&1").c_str()));
}

std::filesystem::path FindArtifact(const std::filesystem::path &directory,
                                   const std::string &extension) {
  for (const auto &entry : std::filesystem::directory_iterator(directory)) {
    if (entry.path().extension() == extension) {
      return entry.path();
    }
  }
  return {};
}

class CliIntegrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    cli_ = ExecutableUnderTest();
    ASSERT_TRUE(std::filesystem::exists(cli_))
        << "Expected CLI executable at " << cli_;
    diff_file_ = project_.AddFile("change.diff", kSampleDiff);
    const auto reviewer = project_.AddScript(
        "stages/reviewer.sh",
        std::string("cat > /dev/null\ncat <<'JSON'\n") + kStageOutput +
            "\nJSON\n");
    const auto quiet = project_.AddScript("stages/quiet.sh",
                                          "cat > /dev/null\necho '[]'\n");
    config_file_ = project_.AddFile(
        "review.yaml", "formats: [markdown, json]\n"
                       "stages:\n"
                       "  - name: code-review\n"
                       "    command: " +
                           reviewer.string() +
                           "\n"
                           "  - name: security\n"
                           "    command: " +
                           quiet.string() + "\n");
  }

  std::string ReviewCommand(const std::filesystem::path &output) const {
    return cli_.string() + " review --file " + diff_file_.string() +
           " --config " + config_file_.string() + " --out " +
           output.string();
  }

  test::TemporaryDirectory project_;
  std::filesystem::path cli_;
  std::filesystem::path diff_file_;
  std::filesystem::path config_file_;
};

TEST_F(CliIntegrationTest, WritesMarkdownAndJsonReports) {
  const auto output = project_.root() / "reports";

  ASSERT_EQ(ExitCode(ReviewCommand(output)), 0);

  const auto markdown = FindArtifact(output, ".md");
  const auto json = FindArtifact(output, ".json");
  ASSERT_FALSE(markdown.empty());
  ASSERT_FALSE(json.empty());
  EXPECT_THAT(markdown.filename().string(), ::testing::StartsWith("code-review-"));
  EXPECT_THAT(LoadFile(markdown), HasSubstr("- [ ] **[HIGH]** Null Check"));
  EXPECT_THAT(LoadFile(markdown), HasSubstr("## Stage: security"));
  EXPECT_THAT(LoadFile(json), HasSubstr("\"total_findings\": 1"));
}

TEST_F(CliIntegrationTest, FailsOnThresholdSeverity) {
  const auto output = project_.root() / "reports";
  EXPECT_EQ(ExitCode(ReviewCommand(output) + " --fail-on high"), 2);
  EXPECT_EQ(ExitCode(ReviewCommand(output) + " --fail-on critical"), 0);
}

TEST_F(CliIntegrationTest, ExtractsCheckedFindings) {
  const auto output = project_.root() / "reports";
  ASSERT_EQ(ExitCode(ReviewCommand(output) + " --format markdown"), 0);
  const auto markdown = FindArtifact(output, ".md");
  ASSERT_FALSE(markdown.empty());

  auto content = LoadFile(markdown);
  const auto box = content.find("- [ ]");
  ASSERT_NE(box, std::string::npos);
  content.replace(box, 5, "- [x]");
  const auto checked = project_.AddFile("checked.md", content);

  const auto selection = project_.root() / "selected" / "fix.json";
  ASSERT_EQ(ExitCode(cli_.string() + " extract " + checked.string() +
                     " --format json --out " + selection.string()),
            0);
  const auto json = LoadFile(selection);
  EXPECT_THAT(json, HasSubstr("\"total\": 1"));
  EXPECT_THAT(json, HasSubstr("\"file\": \"src/user.ts\""));
  EXPECT_THAT(json, HasSubstr("\"suggestion\": \"use optional chaining\""));
}

TEST_F(CliIntegrationTest, NothingToReviewIsSuccess) {
  const auto docs_only = project_.AddFile(
      "docs.diff", "diff --git a/README.md b/README.md\n@@ -1 +1 @@\n+docs\n");
  const auto output = project_.root() / "reports";

  EXPECT_EQ(ExitCode(cli_.string() + " review --file " + docs_only.string() +
                     " --out " + output.string()),
            0);
  EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(CliIntegrationTest, MissingStageCommandFailsTheRun) {
  const auto config = project_.AddFile(
      "broken.yaml", "stages:\n"
                     "  - name: code-review\n"
                     "    command: diff-review-no-such-stage\n");
  const auto output = project_.root() / "reports";

  EXPECT_EQ(ExitCode(cli_.string() + " review --file " + diff_file_.string() +
                     " --config " + config.string() + " --out " +
                     output.string()),
            1);
}

TEST_F(CliIntegrationTest, RejectsUnknownCommandsAndArguments) {
  EXPECT_EQ(ExitCode(cli_.string() + " frobnicate"), 1);
  EXPECT_EQ(ExitCode(cli_.string() + " review --bogus"), 1);
  EXPECT_EQ(ExitCode(cli_.string() + " --help"), 0);
}

} // namespace
} // namespace review
