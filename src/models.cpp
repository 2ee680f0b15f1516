#include <review/models.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace review {
namespace {

std::string Lowercase(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

std::string ToString(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::kAdd:
    return "add";
  case ChangeKind::kDelete:
    return "delete";
  case ChangeKind::kContext:
    return "context";
  }
  return "unknown";
}

std::string ToString(FileStatus status) {
  switch (status) {
  case FileStatus::kAdded:
    return "added";
  case FileStatus::kModified:
    return "modified";
  case FileStatus::kDeleted:
    return "deleted";
  case FileStatus::kRenamed:
    return "renamed";
  }
  return "unknown";
}

std::string ToString(FindingKind kind) {
  switch (kind) {
  case FindingKind::kError:
    return "error";
  case FindingKind::kWarning:
    return "warning";
  case FindingKind::kInfo:
    return "info";
  }
  return "unknown";
}

std::string ToString(Severity severity) {
  switch (severity) {
  case Severity::kCritical:
    return "critical";
  case Severity::kHigh:
    return "high";
  case Severity::kMedium:
    return "medium";
  case Severity::kLow:
    return "low";
  }
  return "unknown";
}

std::optional<FindingKind> ParseFindingKind(const std::string &value) {
  const auto normalized = Lowercase(value);
  if (normalized == "error") {
    return FindingKind::kError;
  }
  if (normalized == "warning") {
    return FindingKind::kWarning;
  }
  if (normalized == "info") {
    return FindingKind::kInfo;
  }
  return std::nullopt;
}

std::optional<Severity> ParseSeverity(const std::string &value) {
  const auto normalized = Lowercase(value);
  if (normalized == "critical") {
    return Severity::kCritical;
  }
  if (normalized == "high") {
    return Severity::kHigh;
  }
  if (normalized == "medium") {
    return Severity::kMedium;
  }
  if (normalized == "low") {
    return Severity::kLow;
  }
  return std::nullopt;
}

bool AtLeast(Severity severity, Severity threshold) {
  return static_cast<int>(severity) <= static_cast<int>(threshold);
}

std::string FormatSummary(const DiffStat &stat) {
  return std::to_string(stat.files_changed) + " files changed, " +
         std::to_string(stat.insertions) + " insertions(+), " +
         std::to_string(stat.deletions) + " deletions(-)";
}

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
  const auto since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          time.time_since_epoch());
  auto milliseconds = since_epoch.count() % 1000;
  if (milliseconds < 0) {
    milliseconds += 1000;
  }
  const auto seconds = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  std::ostringstream stream;
  stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
         << std::setfill('0') << milliseconds << 'Z';
  return stream.str();
}

} // namespace review
