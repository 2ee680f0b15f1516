#pragma once

#include <review/interfaces.h>
#include <review/logging.h>
#include <review/models.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace review {

struct ReviewOptions {
  std::optional<std::filesystem::path> repository;
  std::optional<std::string> commit;
  std::optional<std::string> base;
  std::optional<std::filesystem::path> diff_file;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::vector<std::string> formats;
  std::vector<std::string> extensions;
  std::vector<std::string> disabled_stages;
  std::optional<std::vector<StageSpec>> stages;
  std::optional<Severity> fail_on;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct ExtractOptions {
  std::optional<std::filesystem::path> report;
  std::string format = "markdown";
  std::optional<std::filesystem::path> output_file;
  bool show_help = false;
};

const std::vector<StageSpec> &DefaultStageSpecs();

ReviewOptions ParseReviewArguments(const std::vector<std::string> &arguments);
ReviewOptions ParseConfigFile(const std::filesystem::path &path);
ReviewOptions MergeOptions(const ReviewOptions &config_options,
                           const ReviewOptions &cli_options);
ReviewOptions ResolveReviewOptions(const ReviewOptions &cli_options);

// Configured (or default) stages with --disable-stage applied. Throws
// std::invalid_argument when a disabled name matches no stage.
std::vector<StageSpec> ResolveStageSpecs(const ReviewOptions &options);

ExtractOptions ParseExtractArguments(const std::vector<std::string> &arguments);

void PrintReviewSummary(const PipelineOutcome &outcome, std::ostream &stream);

int RunReview(const std::vector<std::string> &arguments);
int RunExtract(const std::vector<std::string> &arguments);

} // namespace review
