#include <review/unified_diff_parser.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string_view>
#include <utility>

namespace review {
namespace {

constexpr std::string_view kFileBoundary = "diff --git ";

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.substr(value.size() - suffix.size()) == suffix;
}

std::vector<std::string> SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::string::size_type start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

struct HeaderPaths {
  std::string old_path;
  std::string new_path;
};

// "a/<old> b/<new>": <old> stops at the first " b/" after one character.
std::optional<HeaderPaths> ParseHeaderPaths(std::string_view header) {
  if (!StartsWith(header, "a/")) {
    return std::nullopt;
  }
  const auto separator = header.find(" b/", 3);
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  HeaderPaths paths;
  paths.old_path = std::string(header.substr(2, separator - 2));
  paths.new_path = std::string(header.substr(separator + 3));
  if (paths.new_path.empty()) {
    return std::nullopt;
  }
  return paths;
}

bool ConsumeDigits(std::string_view line, std::size_t &index,
                   std::size_t minimum) {
  const auto start = index;
  while (index < line.size() &&
         std::isdigit(static_cast<unsigned char>(line[index])) != 0) {
    ++index;
  }
  return index - start >= minimum;
}

bool ConsumeLiteral(std::string_view line, std::size_t &index,
                    std::string_view literal) {
  if (line.substr(index, literal.size()) != literal) {
    return false;
  }
  index += literal.size();
  return true;
}

// "@@ -<oldStart>[,<oldCount>] +<newStart>[,<newCount>] @@"
std::optional<int> ParseHunkNewStart(std::string_view line) {
  std::size_t index = 0;
  if (!ConsumeLiteral(line, index, "@@ -") || !ConsumeDigits(line, index, 1)) {
    return std::nullopt;
  }
  if (ConsumeLiteral(line, index, ",")) {
    ConsumeDigits(line, index, 0);
  }
  if (!ConsumeLiteral(line, index, " +")) {
    return std::nullopt;
  }
  const auto new_start_begin = index;
  if (!ConsumeDigits(line, index, 1)) {
    return std::nullopt;
  }
  const auto new_start = line.substr(new_start_begin, index - new_start_begin);
  if (ConsumeLiteral(line, index, ",")) {
    ConsumeDigits(line, index, 0);
  }
  if (!ConsumeLiteral(line, index, " @@")) {
    return std::nullopt;
  }
  try {
    return std::stoi(std::string(new_start));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

enum class BlockState { kHeader, kHunk };

template <typename LineIterator>
std::optional<FileDiff> ParseFileBlock(std::string_view header,
                                       LineIterator begin, LineIterator end,
                                       Logger &logger) {
  const auto paths = ParseHeaderPaths(header);
  if (!paths) {
    logger.Log(LogLevel::kDebug, "diff.block.malformed",
               {{"header", std::string(header)}});
    return std::nullopt;
  }

  FileDiff file;
  file.path = paths->new_path;
  if (paths->old_path != paths->new_path) {
    file.old_path = paths->old_path;
  }

  bool new_file = false;
  bool deleted_file = false;
  auto state = BlockState::kHeader;
  int current_line = 0;

  for (auto it = begin; it != end; ++it) {
    const std::string_view line = *it;

    if (const auto new_start = ParseHunkNewStart(line)) {
      current_line = *new_start;
      state = BlockState::kHunk;
      continue;
    }

    if (state == BlockState::kHeader) {
      if (StartsWith(line, "new file mode")) {
        new_file = true;
      } else if (StartsWith(line, "deleted file mode")) {
        deleted_file = true;
      }
      continue;
    }

    if (StartsWith(line, "+") && !StartsWith(line, "+++")) {
      file.changes.push_back(
          Change{ChangeKind::kAdd, current_line, std::string(line.substr(1))});
      ++file.additions;
      ++current_line;
    } else if (StartsWith(line, "-") && !StartsWith(line, "---")) {
      file.changes.push_back(Change{ChangeKind::kDelete, current_line,
                                    std::string(line.substr(1))});
      ++file.deletions;
    } else if (StartsWith(line, " ")) {
      file.changes.push_back(Change{ChangeKind::kContext, current_line,
                                    std::string(line.substr(1))});
      ++current_line;
    }
  }

  if (new_file) {
    file.status = FileStatus::kAdded;
  } else if (deleted_file) {
    file.status = FileStatus::kDeleted;
  } else if (file.old_path) {
    file.status = FileStatus::kRenamed;
  } else {
    file.status = FileStatus::kModified;
  }
  return file;
}

} // namespace

const std::vector<std::string> &DefaultSupportedExtensions() {
  static const std::vector<std::string> extensions = {".ts", ".tsx", ".js",
                                                      ".jsx"};
  return extensions;
}

UnifiedDiffParser::UnifiedDiffParser(
    std::vector<std::string> supported_extensions,
    std::shared_ptr<Logger> logger)
    : supported_extensions_(std::move(supported_extensions)),
      logger_(EnsureLogger(std::move(logger))) {}

bool UnifiedDiffParser::IsSupported(const std::string &path) const {
  return std::any_of(
      supported_extensions_.begin(), supported_extensions_.end(),
      [&](const std::string &extension) { return EndsWith(path, extension); });
}

ParsedDiff UnifiedDiffParser::Parse(const std::string &text,
                                    const std::optional<DiffStat> &stat) const {
  const auto lines = SplitLines(text);

  ParsedDiff diff;
  std::size_t dropped = 0;
  const auto accept = [&](std::optional<FileDiff> file) {
    if (!file) {
      ++dropped;
      return;
    }
    if (!IsSupported(file->path)) {
      logger_->Log(LogLevel::kDebug, "diff.file.unsupported",
                   {{"path", file->path}});
      return;
    }
    diff.total_additions += file->additions;
    diff.total_deletions += file->deletions;
    diff.files.push_back(std::move(*file));
  };

  auto block_start = std::find_if(lines.begin(), lines.end(),
                                  [](const std::string &line) {
                                    return StartsWith(line, kFileBoundary);
                                  });
  while (block_start != lines.end()) {
    const auto body_start = std::next(block_start);
    const auto block_end = std::find_if(
        body_start, lines.end(), [](const std::string &line) {
          return StartsWith(line, kFileBoundary);
        });
    const std::string_view header =
        std::string_view(*block_start).substr(kFileBoundary.size());
    accept(ParseFileBlock(header, body_start, block_end, *logger_));
    block_start = block_end;
  }

  if (stat) {
    diff.summary = FormatSummary(*stat);
  } else {
    diff.summary = FormatSummary(DiffStat{static_cast<int>(diff.files.size()),
                                          diff.total_additions,
                                          diff.total_deletions});
  }

  logger_->Log(LogLevel::kDebug, "diff.parse.complete",
               {{"files", std::to_string(diff.files.size())},
                {"dropped_blocks", std::to_string(dropped)},
                {"additions", std::to_string(diff.total_additions)},
                {"deletions", std::to_string(diff.total_deletions)}});
  return diff;
}

ParsedDiff
UnifiedDiffParser::ParseFile(const std::filesystem::path &path) const {
  std::error_code error;
  if (!std::filesystem::is_regular_file(path, error)) {
    throw DiffUnreadable("Failed to read diff file: " + path.string() +
                         " does not exist");
  }
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw DiffUnreadable("Failed to read diff file: " + path.string());
  }
  std::ostringstream content;
  content << stream.rdbuf();
  if (stream.bad()) {
    throw DiffUnreadable("Failed to read diff file: " + path.string());
  }
  return Parse(content.str());
}

ParsedDiff
UnifiedDiffParser::ParseCommit(DiffProvider &provider,
                               const std::string &commit,
                               const std::optional<std::string> &base) const {
  DiffText resolved;
  try {
    resolved = provider.Diff(commit, base);
  } catch (const std::exception &ex) {
    throw DiffUnreadable(std::string("Failed to parse git diff: ") +
                         ex.what());
  }
  return Parse(resolved.text, resolved.stat);
}

} // namespace review
