#include <review/review_pipeline.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace review {
namespace {

std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
}

void CountSeverity(Severity severity, ReportSummary &summary) {
  switch (severity) {
  case Severity::kCritical:
    ++summary.critical;
    break;
  case Severity::kHigh:
    ++summary.high;
    break;
  case Severity::kMedium:
    ++summary.medium;
    break;
  case Severity::kLow:
    ++summary.low;
    break;
  }
}

void WriteArtifact(const std::filesystem::path &path,
                   const std::string &content) {
  std::ofstream stream(path, std::ios::binary | std::ios::trunc);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
  stream.close();
  if (!stream) {
    throw std::runtime_error("Failed to write output file: " + path.string());
  }
}

} // namespace

Report AggregateReport(std::vector<StageResult> stages,
                       std::chrono::system_clock::time_point generated_at,
                       std::chrono::milliseconds elapsed) {
  Report report;
  report.generated_at = generated_at;
  report.elapsed = elapsed;

  AggregatedTokenUsage usage;
  for (const auto &stage : stages) {
    report.summary.by_stage.emplace_back(stage.stage_name,
                                         stage.findings.size());
    if (stage.token_usage) {
      usage.total += stage.token_usage->total_tokens;
      usage.by_stage.emplace_back(stage.stage_name,
                                  stage.token_usage->total_tokens);
    }
    for (const auto &finding : stage.findings) {
      ++report.summary.total_findings;
      CountSeverity(finding.severity, report.summary);
    }
  }
  if (usage.total > 0) {
    report.token_usage = std::move(usage);
  }
  report.stages = std::move(stages);
  return report;
}

std::string ArtifactTimestamp(std::chrono::system_clock::time_point time) {
  auto timestamp = FormatTimestamp(time);
  std::replace_if(
      timestamp.begin(), timestamp.end(),
      [](char character) { return character == ':' || character == '.'; },
      '-');
  return timestamp;
}

ReviewPipeline::ReviewPipeline(PipelineComponents components)
    : stages_(std::move(components.stages)),
      renderers_(std::move(components.renderers)),
      output_directory_(std::move(components.output_directory)),
      logger_(EnsureLogger(std::move(components.logger))) {}

std::vector<std::string> ReviewPipeline::StageNames() const {
  std::vector<std::string> names;
  names.reserve(stages_.size());
  for (const auto &stage : stages_) {
    names.push_back(stage->Name());
  }
  return names;
}

PipelineOutcome ReviewPipeline::Execute(const ParsedDiff &diff) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"stages", std::to_string(stages_.size())},
                {"files", std::to_string(diff.files.size())}});
  const auto pipeline_start = std::chrono::steady_clock::now();

  PipelineOutcome outcome;
  for (const auto &stage : stages_) {
    try {
      stage->Prepare();
    } catch (const std::exception &ex) {
      logger_->Log(LogLevel::kError, "pipeline.setup.failed",
                   {{"stage", stage->Name()}, {"error", ex.what()}});
      outcome.error = ex.what();
      return outcome;
    }
  }

  std::vector<Finding> accumulated;
  std::vector<StageResult> results;
  results.reserve(stages_.size());
  for (const auto &stage : stages_) {
    const StageContext context{
        diff, std::make_shared<const std::vector<Finding>>(accumulated)};
    auto result = RunStage(*stage, context);
    accumulated.insert(accumulated.end(), result.findings.begin(),
                       result.findings.end());
    results.push_back(std::move(result));
  }

  const auto generated_at = std::chrono::system_clock::now();
  auto report =
      AggregateReport(std::move(results), generated_at,
                      ElapsedSince(pipeline_start));
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(report.elapsed.count())},
                {"findings", std::to_string(report.summary.total_findings)}});

  outcome.outputs = WriteOutputs(report);
  outcome.report = std::move(report);
  outcome.success = true;
  return outcome;
}

StageResult ReviewPipeline::RunStage(AnalysisStage &stage,
                                     const StageContext &context) {
  const auto name = stage.Name();
  logger_->Log(LogLevel::kInfo, "pipeline.stage.start", {{"stage", name}});
  const auto start = std::chrono::steady_clock::now();
  try {
    auto result = stage.Run(context);
    result.stage_name = name;
    logger_->Log(LogLevel::kInfo, "pipeline.stage.complete",
                 {{"stage", name},
                  {"findings", std::to_string(result.findings.size())},
                  {"elapsed_ms", std::to_string(result.elapsed.count())}});
    return result;
  } catch (const std::exception &ex) {
    StageResult failed;
    failed.stage_name = name;
    failed.elapsed = ElapsedSince(start);
    failed.failed = true;
    failed.error = ex.what();
    logger_->Log(LogLevel::kError, "pipeline.stage.failed",
                 {{"stage", name},
                  {"error", failed.error},
                  {"elapsed_ms", std::to_string(failed.elapsed.count())}});
    return failed;
  }
}

std::vector<RenderedOutput>
ReviewPipeline::WriteOutputs(const Report &report) {
  std::vector<RenderedOutput> outputs;
  if (renderers_.empty()) {
    return outputs;
  }

  std::error_code error;
  std::filesystem::create_directories(output_directory_, error);
  if (error) {
    logger_->Log(LogLevel::kError, "output.directory.failed",
                 {{"directory", output_directory_.string()},
                  {"error", error.message()}});
  }

  const auto timestamp = ArtifactTimestamp(report.generated_at);
  for (const auto &renderer : renderers_) {
    const auto format = renderer->Format();
    try {
      const auto path = output_directory_ /
                        ("code-review-" + timestamp + renderer->FileExtension());
      WriteArtifact(path, renderer->Render(report));
      outputs.push_back(RenderedOutput{format, path.string()});
      logger_->Log(LogLevel::kInfo, "output.written",
                   {{"format", format}, {"path", path.string()}});
    } catch (const std::exception &ex) {
      logger_->Log(LogLevel::kError, "output.write.failed",
                   {{"format", format}, {"error", ex.what()}});
    }
  }
  return outputs;
}

} // namespace review
