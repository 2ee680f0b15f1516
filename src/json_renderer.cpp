#include <review/json_renderer.h>

#include <review/json_writer.h>

#include <cstdint>

namespace review {
namespace {

void WriteSummary(JsonWriter &writer, const ReportSummary &summary) {
  writer.BeginObject();
  writer.Key("total_findings").Int(static_cast<std::int64_t>(summary.total_findings));
  writer.Key("critical").Int(static_cast<std::int64_t>(summary.critical));
  writer.Key("high").Int(static_cast<std::int64_t>(summary.high));
  writer.Key("medium").Int(static_cast<std::int64_t>(summary.medium));
  writer.Key("low").Int(static_cast<std::int64_t>(summary.low));
  writer.Key("by_stage").BeginObject();
  for (const auto &[stage, count] : summary.by_stage) {
    writer.Key(stage).Int(static_cast<std::int64_t>(count));
  }
  writer.EndObject();
  writer.EndObject();
}

void WriteTokenUsage(JsonWriter &writer, const AggregatedTokenUsage &usage) {
  writer.BeginObject();
  writer.Key("total").Int(usage.total);
  writer.Key("by_stage").BeginObject();
  for (const auto &[stage, tokens] : usage.by_stage) {
    writer.Key(stage).Int(tokens);
  }
  writer.EndObject();
  writer.EndObject();
}

void WriteStage(JsonWriter &writer, const StageResult &stage) {
  writer.BeginObject();
  writer.Key("name").String(stage.stage_name);
  writer.Key("elapsed_ms").Int(stage.elapsed.count());
  writer.Key("failed").Bool(stage.failed);
  if (stage.failed) {
    writer.Key("error").String(stage.error);
  }
  if (stage.token_usage) {
    writer.Key("token_usage");
    WriteJson(writer, *stage.token_usage);
  }
  writer.Key("findings").BeginArray();
  for (const auto &finding : stage.findings) {
    WriteJson(writer, finding);
  }
  writer.EndArray();
  writer.EndObject();
}

} // namespace

std::string JsonRenderer::Render(const Report &report) {
  JsonWriter writer;
  writer.BeginObject();
  writer.Key("generated_at").String(FormatTimestamp(report.generated_at));
  writer.Key("execution_time_ms").Int(report.elapsed.count());
  writer.Key("summary");
  WriteSummary(writer, report.summary);
  if (report.token_usage) {
    writer.Key("token_usage");
    WriteTokenUsage(writer, *report.token_usage);
  }
  writer.Key("stages").BeginArray();
  for (const auto &stage : report.stages) {
    WriteStage(writer, stage);
  }
  writer.EndArray();
  writer.EndObject();
  return writer.str() + "\n";
}

} // namespace review
