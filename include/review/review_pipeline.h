#pragma once

#include <review/interfaces.h>
#include <review/logging.h>
#include <review/models.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace review {

struct PipelineComponents {
  std::vector<std::unique_ptr<AnalysisStage>> stages;
  std::vector<std::unique_ptr<ReportRenderer>> renderers;
  std::filesystem::path output_directory = "reports";
  std::shared_ptr<Logger> logger;
};

// Counts per severity and per stage in one pass over the stage results, in
// execution order.
Report AggregateReport(std::vector<StageResult> stages,
                       std::chrono::system_clock::time_point generated_at,
                       std::chrono::milliseconds elapsed);

// "2026-10-18T09-41-07-123Z": UTC ISO-8601 with ':' and '.' replaced.
std::string ArtifactTimestamp(std::chrono::system_clock::time_point time);

class ReviewPipeline {
public:
  explicit ReviewPipeline(PipelineComponents components);

  // Runs every stage in configuration order. Only a failure while preparing
  // the stages yields an unsuccessful outcome; a stage that throws
  // contributes an empty result and a failed artifact is skipped.
  PipelineOutcome Execute(const ParsedDiff &diff);

  std::vector<std::string> StageNames() const;

private:
  StageResult RunStage(AnalysisStage &stage, const StageContext &context);
  std::vector<RenderedOutput> WriteOutputs(const Report &report);

  std::vector<std::unique_ptr<AnalysisStage>> stages_;
  std::vector<std::unique_ptr<ReportRenderer>> renderers_;
  std::filesystem::path output_directory_;
  std::shared_ptr<Logger> logger_;
};

} // namespace review
