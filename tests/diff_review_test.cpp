#include <review/diff_review.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include "test_support/temporary_directory.h"

namespace review {
namespace {

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::Optional;

std::string PathOf(const std::optional<std::filesystem::path> &path) {
  return path ? path->string() : std::string();
}

TEST(ReviewArgumentsTest, ParsesSourceAndOutputOptions) {
  const auto options = ParseReviewArguments(
      {"--commit", "abc123", "--base", "main", "--repo", "/tmp/project",
       "--out", "build/reports", "--format", "JSON, markdown,json",
       "--extensions", "ts,.py", "--disable-stage", "security",
       "--fail-on", "High", "--verbose"});

  EXPECT_THAT(options.commit, Optional(std::string("abc123")));
  EXPECT_THAT(options.base, Optional(std::string("main")));
  EXPECT_EQ(PathOf(options.repository), "/tmp/project");
  EXPECT_EQ(PathOf(options.output_directory), "build/reports");
  EXPECT_THAT(options.formats, ElementsAre("json", "markdown"));
  EXPECT_THAT(options.extensions, ElementsAre(".ts", ".py"));
  EXPECT_THAT(options.disabled_stages, ElementsAre("security"));
  EXPECT_THAT(options.fail_on, Optional(Severity::kHigh));
  EXPECT_THAT(options.log_level, Optional(LogLevel::kInfo));
  EXPECT_FALSE(options.show_help);
}

TEST(ReviewArgumentsTest, AcceptsShortFlags) {
  const auto options = ParseReviewArguments({"-c", "HEAD~1", "-f", "x.diff"});
  EXPECT_THAT(options.commit, Optional(std::string("HEAD~1")));
  EXPECT_EQ(PathOf(options.diff_file), "x.diff");
}

TEST(ReviewArgumentsTest, StopsAtHelp) {
  const auto options = ParseReviewArguments({"--help", "--bogus"});
  EXPECT_TRUE(options.show_help);
}

TEST(ReviewArgumentsTest, RejectsInvalidArguments) {
  EXPECT_THROW(ParseReviewArguments({"--bogus"}), std::invalid_argument);
  EXPECT_THROW(ParseReviewArguments({"--commit"}), std::invalid_argument);
  EXPECT_THROW(ParseReviewArguments({"--format", "html"}),
               std::invalid_argument);
  EXPECT_THROW(ParseReviewArguments({"--fail-on", "severe"}),
               std::invalid_argument);
}

TEST(ReviewConfigTest, ParsesYamlWithAliasesAndStages) {
  test::TemporaryDirectory directory;
  const auto path = directory.AddFile("review.yaml", R"(repository: /work/app
commit: feature
output-directory: out/reports
format: [json]
extensions: .ts
fail_on: medium
log_level: debug
stages:
  - name: lint
    command: ./lint-stage --strict
  - name: security
    kind: command
    command: diff-review-security
    enabled: false
)");

  const auto options = ParseConfigFile(path);

  EXPECT_EQ(PathOf(options.repository), "/work/app");
  EXPECT_THAT(options.commit, Optional(std::string("feature")));
  EXPECT_EQ(PathOf(options.output_directory), "out/reports");
  EXPECT_THAT(options.formats, ElementsAre("json"));
  EXPECT_THAT(options.extensions, ElementsAre(".ts"));
  EXPECT_THAT(options.fail_on, Optional(Severity::kMedium));
  EXPECT_THAT(options.log_level, Optional(LogLevel::kDebug));
  ASSERT_TRUE(options.stages.has_value());
  EXPECT_THAT(
      *options.stages,
      ElementsAre(AllOf(Field(&StageSpec::name, "lint"),
                        Field(&StageSpec::kind, "command"),
                        Field(&StageSpec::command, "./lint-stage --strict"),
                        Field(&StageSpec::enabled, true)),
                  AllOf(Field(&StageSpec::name, "security"),
                        Field(&StageSpec::enabled, false))));
}

TEST(ReviewConfigTest, RejectsUnknownKeys) {
  test::TemporaryDirectory directory;
  const auto unknown = directory.AddFile("a.yml", "colour: red\n");
  try {
    ParseConfigFile(unknown);
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown config key: colour"));
    EXPECT_THAT(error.what(), HasSubstr("stages"));
  }

  const auto bad_stage = directory.AddFile(
      "b.yml", "stages:\n  - name: x\n    timeout: 5\n");
  EXPECT_THROW(ParseConfigFile(bad_stage), std::invalid_argument);

  const auto unnamed = directory.AddFile(
      "c.yml", "stages:\n  - command: diff-review-security\n");
  EXPECT_THROW(ParseConfigFile(unnamed), std::invalid_argument);
}

TEST(ReviewConfigTest, RejectsMissingOrUnsupportedFiles) {
  test::TemporaryDirectory directory;
  EXPECT_THROW(ParseConfigFile(directory.root() / "missing.yml"),
               std::runtime_error);
  const auto json = directory.AddFile("review.json", "{}");
  EXPECT_THROW(ParseConfigFile(json), std::invalid_argument);
}

TEST(ReviewConfigTest, CommandLineOverridesConfig) {
  ReviewOptions config;
  config.commit = "from-config";
  config.base = "main";
  config.formats = {"json"};
  config.disabled_stages = {"performance"};

  ReviewOptions cli;
  cli.commit = "from-cli";
  cli.formats = {"markdown"};

  const auto merged = MergeOptions(config, cli);

  EXPECT_THAT(merged.commit, Optional(std::string("from-cli")));
  EXPECT_THAT(merged.base, Optional(std::string("main")));
  EXPECT_THAT(merged.formats, ElementsAre("markdown"));
  EXPECT_THAT(merged.disabled_stages, ElementsAre("performance"));
}

TEST(ReviewConfigTest, ResolveReadsConfiguredFile) {
  test::TemporaryDirectory directory;
  const auto path = directory.AddFile("review.yml", "base: develop\n");

  ReviewOptions cli;
  cli.config_file = path;
  cli.commit = "abc";
  const auto resolved = ResolveReviewOptions(cli);

  EXPECT_THAT(resolved.base, Optional(std::string("develop")));
  EXPECT_THAT(resolved.commit, Optional(std::string("abc")));
}

TEST(StageSpecsTest, DefaultsToThreeBuiltInStages) {
  const auto specs = ResolveStageSpecs(ReviewOptions{});
  EXPECT_THAT(specs, ElementsAre(Field(&StageSpec::name, "code-review"),
                                 Field(&StageSpec::name, "security"),
                                 Field(&StageSpec::name, "performance")));
}

TEST(StageSpecsTest, DisablesNamedStages) {
  ReviewOptions options;
  options.disabled_stages = {"security"};
  const auto specs = ResolveStageSpecs(options);

  ASSERT_EQ(specs.size(), 3u);
  EXPECT_TRUE(specs[0].enabled);
  EXPECT_FALSE(specs[1].enabled);
  EXPECT_TRUE(specs[2].enabled);

  options.disabled_stages = {"style"};
  EXPECT_THROW(ResolveStageSpecs(options), std::invalid_argument);
}

TEST(ExtractArgumentsTest, ParsesReportFormatAndOutput) {
  const auto options =
      ParseExtractArguments({"reports/code-review.md", "--format", "JSON",
                             "--out", "selected.json"});

  EXPECT_EQ(PathOf(options.report), "reports/code-review.md");
  EXPECT_EQ(options.format, "json");
  EXPECT_EQ(PathOf(options.output_file), "selected.json");

  EXPECT_EQ(ParseExtractArguments({"r.md"}).format, "markdown");
  EXPECT_THROW(ParseExtractArguments({"r.md", "--format", "html"}),
               std::invalid_argument);
  EXPECT_THROW(ParseExtractArguments({"a.md", "b.md"}), std::invalid_argument);
}

TEST(ReviewSummaryTest, PrintsCountsStagesAndArtifacts) {
  StageResult failed;
  failed.stage_name = "security";
  failed.failed = true;
  failed.error = "model unavailable";

  Report report;
  report.summary.total_findings = 3;
  report.summary.high = 3;
  report.stages = {failed};
  report.elapsed = std::chrono::milliseconds(1500);

  PipelineOutcome outcome;
  outcome.success = true;
  outcome.report = report;
  outcome.outputs = {RenderedOutput{"markdown", "reports/code-review-x.md"}};

  std::ostringstream stream;
  PrintReviewSummary(outcome, stream);
  const auto text = stream.str();

  EXPECT_THAT(text, HasSubstr("  Total findings: 3\n"));
  EXPECT_THAT(text, HasSubstr("  High: 3\n"));
  EXPECT_THAT(text, HasSubstr("  security: 0 (failed: model unavailable)\n"));
  EXPECT_THAT(text, HasSubstr("  MARKDOWN: reports/code-review-x.md\n"));
  EXPECT_THAT(text, HasSubstr("Execution time: 1.50s\n"));
  EXPECT_THAT(text, Not(HasSubstr("Token usage")));
}

TEST(ReviewSummaryTest, PrintsNothingWithoutReport) {
  std::ostringstream stream;
  PrintReviewSummary(PipelineOutcome{}, stream);
  EXPECT_THAT(stream.str(), IsEmpty());
}

} // namespace
} // namespace review
