#include <review/markdown_renderer.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace review {
namespace {

constexpr std::array<Severity, 4> kSeverityOrder{
    Severity::kCritical, Severity::kHigh, Severity::kMedium, Severity::kLow};

std::string Uppercase(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::string Capitalized(std::string value) {
  if (!value.empty()) {
    value[0] =
        static_cast<char>(std::toupper(static_cast<unsigned char>(value[0])));
  }
  return value;
}

// Checklist fields are single-line.
std::string Flatten(const std::string &value) {
  std::string flattened;
  flattened.reserve(value.size());
  for (const auto character : value) {
    if (character == '\r') {
      continue;
    }
    flattened.push_back(character == '\n' ? ' ' : character);
  }
  return flattened;
}

std::string FormatSeconds(std::chrono::milliseconds elapsed) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2)
         << static_cast<double>(elapsed.count()) / 1000.0 << "s";
  return stream.str();
}

std::string BuildSummaryMarkdown(const ReportSummary &summary) {
  std::ostringstream section;
  section << "## Summary\n\n";
  section << "| Severity | Count |\n";
  section << "| --- | --- |\n";
  section << "| Critical | " << summary.critical << " |\n";
  section << "| High | " << summary.high << " |\n";
  section << "| Medium | " << summary.medium << " |\n";
  section << "| Low | " << summary.low << " |\n";
  section << "| **Total** | " << summary.total_findings << " |\n\n";

  section << "## Findings by Stage\n\n";
  section << "| Stage | Findings |\n";
  section << "| --- | --- |\n";
  if (summary.by_stage.empty()) {
    section << "| None | - |\n\n";
    return section.str();
  }
  for (const auto &[stage, count] : summary.by_stage) {
    section << "| " << stage << " | " << count << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildTokenUsageMarkdown(const AggregatedTokenUsage &usage) {
  std::ostringstream section;
  section << "## Token Usage\n\n";
  section << "| Stage | Tokens |\n";
  section << "| --- | --- |\n";
  for (const auto &[stage, tokens] : usage.by_stage) {
    section << "| " << stage << " | " << tokens << " |\n";
  }
  section << "| **Total** | " << usage.total << " |\n\n";
  return section.str();
}

void AppendCode(std::ostringstream &item, const std::string &code) {
  item << "  - **Code**:\n";
  item << "    ```\n";
  std::istringstream lines(code);
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    item << "    " << line << "\n";
  }
  item << "    ```\n";
}

std::string BuildFindingMarkdown(const Finding &finding) {
  std::ostringstream item;
  item << "- [ ] **[" << Uppercase(ToString(finding.severity)) << "]** "
       << Flatten(finding.category) << "\n";
  item << "  - **Type**: " << ToString(finding.kind) << "\n";
  item << "  - **File**: `" << finding.file << "`";
  if (finding.line) {
    item << ":" << *finding.line;
  }
  item << "\n";
  item << "  - **Issue**: " << Flatten(finding.message) << "\n";
  if (finding.suggestion && !finding.suggestion->empty()) {
    item << "  - **Suggestion**: " << Flatten(*finding.suggestion) << "\n";
  }
  if (finding.code && !finding.code->empty()) {
    AppendCode(item, *finding.code);
  }
  item << "\n";
  return item.str();
}

std::string BuildStageMarkdown(const StageResult &stage) {
  std::ostringstream section;
  section << "## Stage: " << stage.stage_name << "\n\n";
  section << "Execution time: " << FormatSeconds(stage.elapsed) << "\n\n";
  if (stage.failed) {
    section << "> **Stage failed**: " << Flatten(stage.error) << "\n\n";
  }
  if (stage.findings.empty()) {
    section << "No issues found.\n\n";
    return section.str();
  }

  for (const auto severity : kSeverityOrder) {
    std::vector<const Finding *> group;
    for (const auto &finding : stage.findings) {
      if (finding.severity == severity) {
        group.push_back(&finding);
      }
    }
    if (group.empty()) {
      continue;
    }
    section << "### " << Capitalized(ToString(severity)) << " ("
            << group.size() << ")\n\n";
    for (const auto *finding : group) {
      section << BuildFindingMarkdown(*finding);
    }
  }
  return section.str();
}

} // namespace

std::string MarkdownRenderer::Render(const Report &report) {
  std::ostringstream output;
  output << "# Code Review Report\n\n";
  output << "**Generated**: " << FormatTimestamp(report.generated_at) << "\n";
  output << "**Execution Time**: " << FormatSeconds(report.elapsed) << "\n\n";
  output << BuildSummaryMarkdown(report.summary);
  if (report.token_usage) {
    output << BuildTokenUsageMarkdown(*report.token_usage);
  }
  for (const auto &stage : report.stages) {
    output << BuildStageMarkdown(stage);
  }
  return output.str();
}

} // namespace review
