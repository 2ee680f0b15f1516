#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace review {

enum class ChangeKind { kAdd, kDelete, kContext };

struct Change {
  ChangeKind kind = ChangeKind::kContext;
  int line_number = 0;
  std::string content;
};

enum class FileStatus { kAdded, kModified, kDeleted, kRenamed };

struct FileDiff {
  std::string path;
  std::optional<std::string> old_path;
  FileStatus status = FileStatus::kModified;
  int additions = 0;
  int deletions = 0;
  std::vector<Change> changes;
};

struct DiffStat {
  int files_changed = 0;
  int insertions = 0;
  int deletions = 0;
};

struct ParsedDiff {
  std::vector<FileDiff> files;
  int total_additions = 0;
  int total_deletions = 0;
  std::string summary;
};

enum class FindingKind { kError, kWarning, kInfo };

// Declaration order is rank order: kCritical is the most severe.
enum class Severity { kCritical, kHigh, kMedium, kLow };

struct Finding {
  FindingKind kind = FindingKind::kInfo;
  Severity severity = Severity::kLow;
  std::string category;
  std::string message;
  std::string file;
  std::optional<int> line;
  std::optional<std::string> suggestion;
  std::optional<std::string> code;
};

struct TokenUsage {
  int prompt_tokens = 0;
  int completion_tokens = 0;
  int total_tokens = 0;
};

// Read-only view handed to a stage: the diff plus every finding produced by
// the stages that ran before it.
struct StageContext {
  const ParsedDiff &diff;
  std::shared_ptr<const std::vector<Finding>> previous_findings;
};

struct StageResult {
  std::string stage_name;
  std::vector<Finding> findings;
  std::chrono::milliseconds elapsed{0};
  std::optional<TokenUsage> token_usage;
  bool failed = false;
  std::string error;
};

struct ReportSummary {
  std::size_t total_findings = 0;
  std::size_t critical = 0;
  std::size_t high = 0;
  std::size_t medium = 0;
  std::size_t low = 0;
  std::vector<std::pair<std::string, std::size_t>> by_stage;
};

struct AggregatedTokenUsage {
  int total = 0;
  std::vector<std::pair<std::string, int>> by_stage;
};

struct Report {
  ReportSummary summary;
  std::vector<StageResult> stages;
  std::chrono::system_clock::time_point generated_at;
  std::chrono::milliseconds elapsed{0};
  std::optional<AggregatedTokenUsage> token_usage;
};

struct RenderedOutput {
  std::string format;
  std::string path;
};

struct PipelineOutcome {
  bool success = false;
  std::optional<Report> report;
  std::vector<RenderedOutput> outputs;
  std::string error;
};

std::string ToString(ChangeKind kind);
std::string ToString(FileStatus status);
std::string ToString(FindingKind kind);
std::string ToString(Severity severity);

std::optional<FindingKind> ParseFindingKind(const std::string &value);
std::optional<Severity> ParseSeverity(const std::string &value);

bool AtLeast(Severity severity, Severity threshold);

std::string FormatSummary(const DiffStat &stat);

// UTC ISO-8601 with milliseconds: "2026-10-18T09:41:07.123Z".
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

} // namespace review
