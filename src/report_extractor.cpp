#include <review/report_extractor.h>

#include <review/json_writer.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace review {
namespace {

constexpr char kCheckedItemPrefix[] = "- [x] **[";
constexpr char kSeverityTerminator[] = "]** ";
constexpr char kFileMarker[] = "- **File**: `";
constexpr char kIssueMarker[] = "- **Issue**: ";
constexpr char kSuggestionMarker[] = "- **Suggestion**: ";
constexpr char kCodeMarker[] = "- **Code**:";
constexpr char kFence[] = "```";

enum class ExtractorState { kScanning, kInItem, kAwaitingFence, kInCodeFence };

bool IsSpace(char character) {
  return std::isspace(static_cast<unsigned char>(character)) != 0;
}

std::string Trim(const std::string &value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), IsSpace);
  const auto end = std::find_if_not(value.rbegin(), value.rend(), IsSpace).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool StartsWith(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool EndsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  return lines;
}

std::string Lowercase(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Uppercase(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::optional<ExtractedFinding> ParseCheckedItem(const std::string &line) {
  const std::string prefix = kCheckedItemPrefix;
  if (!StartsWith(line, prefix)) {
    return std::nullopt;
  }
  const auto terminator = line.find(kSeverityTerminator, prefix.size() + 1);
  if (terminator == std::string::npos) {
    return std::nullopt;
  }
  auto category = line.substr(terminator + std::string(kSeverityTerminator).size());
  if (category.empty()) {
    return std::nullopt;
  }
  ExtractedFinding finding;
  finding.severity =
      Lowercase(line.substr(prefix.size(), terminator - prefix.size()));
  finding.category = std::move(category);
  return finding;
}

bool EndsItem(const std::string &line) {
  return StartsWith(line, "- [") || StartsWith(line, "##");
}

// Text after |marker| up to the end of the line, when non-empty.
std::optional<std::string> FieldValue(const std::string &line,
                                      const std::string &marker) {
  const auto position = line.find(marker);
  if (position == std::string::npos) {
    return std::nullopt;
  }
  auto value = line.substr(position + marker.size());
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

void ApplyFileField(const std::string &line, ExtractedFinding &finding) {
  const std::string marker = kFileMarker;
  for (auto position = line.find(marker); position != std::string::npos;
       position = line.find(marker, position + 1)) {
    const auto path_begin = position + marker.size();
    const auto path_end = line.find('`', path_begin + 1);
    if (path_begin >= line.size() || path_end == std::string::npos) {
      continue;
    }
    finding.file = line.substr(path_begin, path_end - path_begin);

    auto digits_begin = path_end + 1;
    if (digits_begin < line.size() && line[digits_begin] == ':') {
      ++digits_begin;
      auto digits_end = digits_begin;
      while (digits_end < line.size() &&
             std::isdigit(static_cast<unsigned char>(line[digits_end]))) {
        ++digits_end;
      }
      int number = 0;
      const auto result = std::from_chars(line.data() + digits_begin,
                                          line.data() + digits_end, number);
      if (digits_end > digits_begin && result.ec == std::errc()) {
        finding.line = number;
      }
    }
    return;
  }
}

// Returns true when the line announces a code block.
bool ApplyFieldLine(const std::string &line, ExtractedFinding &finding) {
  ApplyFileField(line, finding);
  if (auto issue = FieldValue(line, kIssueMarker)) {
    finding.issue = std::move(*issue);
  }
  if (auto suggestion = FieldValue(line, kSuggestionMarker)) {
    finding.suggestion = std::move(suggestion);
  }
  return line.find(kCodeMarker) != std::string::npos;
}

// Code lines carry one level of list indentation.
std::string StripCodeIndent(const std::string &line) {
  constexpr std::size_t kIndent = 4;
  if (line.size() >= kIndent &&
      std::all_of(line.begin(), line.begin() + kIndent, IsSpace)) {
    return line.substr(kIndent);
  }
  return line;
}

std::string JoinLines(const std::vector<std::string> &lines) {
  std::string joined;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      joined.push_back('\n');
    }
    joined += lines[i];
  }
  return joined;
}

} // namespace

std::vector<ExtractedFinding> ExtractCheckedFindings(const std::string &markdown) {
  std::vector<ExtractedFinding> findings;
  std::optional<ExtractedFinding> current;
  std::vector<std::string> code_lines;
  auto state = ExtractorState::kScanning;

  const auto finish_item = [&]() {
    if (current && !current->file.empty() && !current->issue.empty()) {
      findings.push_back(std::move(*current));
    }
    current.reset();
    state = ExtractorState::kScanning;
  };

  for (const auto &line : SplitLines(markdown)) {
    if (state == ExtractorState::kInCodeFence) {
      if (EndsWith(Trim(line), kFence)) {
        current->code = JoinLines(code_lines);
        state = ExtractorState::kInItem;
      } else {
        code_lines.push_back(StripCodeIndent(line));
      }
      continue;
    }

    if (state == ExtractorState::kAwaitingFence) {
      if (StartsWith(Trim(line), kFence)) {
        code_lines.clear();
        state = ExtractorState::kInCodeFence;
        continue;
      }
      state = ExtractorState::kInItem;
    }

    if (state == ExtractorState::kInItem) {
      if (!EndsItem(line)) {
        if (ApplyFieldLine(line, *current)) {
          state = ExtractorState::kAwaitingFence;
        }
        continue;
      }
      finish_item();
    }

    if (auto item = ParseCheckedItem(line)) {
      current = std::move(item);
      state = ExtractorState::kInItem;
    }
  }

  if (state == ExtractorState::kInCodeFence) {
    current->code = JoinLines(code_lines);
  }
  finish_item();
  return findings;
}

std::vector<ExtractedFinding>
ExtractCheckedFindingsFromFile(const std::filesystem::path &report_path) {
  std::ifstream stream(report_path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to read report: " + report_path.string());
  }
  std::ostringstream content;
  content << stream.rdbuf();
  return ExtractCheckedFindings(content.str());
}

std::string FormatFindingsAsMarkdown(const std::vector<ExtractedFinding> &findings) {
  if (findings.empty()) {
    return "# No findings selected\n\n"
           "Please check boxes in the report to select findings to fix.\n";
  }

  std::ostringstream output;
  output << "# Selected Findings to Fix\n\n";
  output << "Total: " << findings.size() << " issue(s)\n\n";
  output << "---\n\n";

  for (std::size_t i = 0; i < findings.size(); ++i) {
    const auto &finding = findings[i];
    output << "## " << (i + 1) << ". [" << Uppercase(finding.severity) << "] "
           << finding.category << "\n\n";
    output << "**File**: `" << finding.file << "`";
    if (finding.line && *finding.line != 0) {
      output << ":" << *finding.line;
    }
    output << "\n\n";
    output << "**Issue**: " << finding.issue << "\n\n";
    if (finding.suggestion && !finding.suggestion->empty()) {
      output << "**Suggested Fix**: " << *finding.suggestion << "\n\n";
    }
    if (finding.code && !finding.code->empty()) {
      output << "**Current Code**:\n```typescript\n"
             << *finding.code << "\n```\n\n";
    }
    output << "---\n\n";
  }
  return output.str();
}

std::string FormatFindingsAsJson(const std::vector<ExtractedFinding> &findings) {
  JsonWriter writer;
  writer.BeginObject();
  writer.Key("total").Int(static_cast<std::int64_t>(findings.size()));
  writer.Key("findings").BeginArray();
  for (std::size_t i = 0; i < findings.size(); ++i) {
    const auto &finding = findings[i];
    writer.BeginObject();
    writer.Key("id").Int(static_cast<std::int64_t>(i + 1));
    writer.Key("severity").String(finding.severity);
    writer.Key("category").String(finding.category);
    writer.Key("file").String(finding.file);
    if (finding.line) {
      writer.Key("line").Int(*finding.line);
    }
    writer.Key("issue").String(finding.issue);
    if (finding.suggestion) {
      writer.Key("suggestion").String(*finding.suggestion);
    }
    if (finding.code) {
      writer.Key("code").String(*finding.code);
    }
    writer.EndObject();
  }
  writer.EndArray();
  writer.EndObject();
  return writer.str();
}

} // namespace review
