#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace review {

struct ExtractedFinding {
  std::string severity;
  std::string category;
  std::string file;
  std::optional<int> line;
  std::string issue;
  std::optional<std::string> suggestion;
  std::optional<std::string> code;
};

// Collects the checklist items a reviewer ticked ("- [x]") in a rendered
// markdown report. Items without both a file and an issue are skipped.
std::vector<ExtractedFinding> ExtractCheckedFindings(const std::string &markdown);

// Throws std::runtime_error when the report cannot be read.
std::vector<ExtractedFinding>
ExtractCheckedFindingsFromFile(const std::filesystem::path &report_path);

std::string FormatFindingsAsMarkdown(const std::vector<ExtractedFinding> &findings);
std::string FormatFindingsAsJson(const std::vector<ExtractedFinding> &findings);

} // namespace review
