#include <review/git_diff_source.h>
#include <review/process.h>

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace review {
namespace {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  while (!value.empty() && is_space(value.back())) {
    value.pop_back();
  }
  std::size_t start = 0;
  while (start < value.size() && is_space(value[start])) {
    ++start;
  }
  return value.substr(start);
}

// Reads the number that precedes |label| in a shortstat clause.
int CountBefore(const std::string &output, const std::string &label) {
  const auto position = output.find(label);
  if (position == std::string::npos) {
    return 0;
  }
  auto end = position;
  while (end > 0 && output[end - 1] == ' ') {
    --end;
  }
  auto start = end;
  while (start > 0 &&
         std::isdigit(static_cast<unsigned char>(output[start - 1])) != 0) {
    --start;
  }
  if (start == end) {
    return 0;
  }
  return std::stoi(output.substr(start, end - start));
}

} // namespace

DiffStat ParseShortStat(const std::string &output) {
  DiffStat stat;
  stat.files_changed = CountBefore(output, "file");
  stat.insertions = CountBefore(output, "insertion");
  stat.deletions = CountBefore(output, "deletion");
  return stat;
}

GitDiffSource::GitDiffSource(std::filesystem::path repository,
                             std::shared_ptr<Logger> logger)
    : repository_(std::move(repository)),
      logger_(EnsureLogger(std::move(logger))) {}

std::string GitDiffSource::Git(const std::vector<std::string> &arguments) {
  std::vector<std::string> command = {"git"};
  command.insert(command.end(), arguments.begin(), arguments.end());

  ProcessOptions options;
  options.working_directory = repository_;
  const auto result = RunProcess(command, options);

  std::ostringstream rendered;
  for (const auto &argument : command) {
    rendered << (rendered.tellp() > 0 ? " " : "") << argument;
  }
  logger_->Log(LogLevel::kDebug, "git.command",
               {{"command", rendered.str()},
                {"exit_code", std::to_string(result.exit_code)}});

  if (result.exit_code != 0) {
    const auto detail = Trim(result.stderr_output);
    throw std::runtime_error(rendered.str() + " failed" +
                             (detail.empty() ? "" : ": " + detail));
  }
  return result.stdout_output;
}

std::string GitDiffSource::ResolveBase(const std::string &commit) {
  // "<commit> <parent>..." for a regular commit, "<commit>" for a root.
  std::istringstream line(Git({"rev-list", "--parents", "-n", "1", commit}));
  std::string self;
  std::string parent;
  line >> self >> parent;
  if (parent.empty()) {
    logger_->Log(LogLevel::kInfo, "git.root_commit", {{"commit", commit}});
    return kEmptyTreeSha;
  }
  return parent;
}

DiffText GitDiffSource::Diff(const std::string &commit,
                             const std::optional<std::string> &base) {
  Git({"rev-parse", "--verify", "--quiet", commit + "^{commit}"});
  const auto from = base ? *base : ResolveBase(commit);

  DiffText diff;
  diff.stat = ParseShortStat(Git({"diff", "--shortstat", from, commit}));
  diff.text = Git({"diff", "--no-color", "--no-ext-diff", from, commit});

  logger_->Log(LogLevel::kInfo, "git.diff.resolved",
               {{"from", from},
                {"to", commit},
                {"files_changed", std::to_string(diff.stat->files_changed)}});
  return diff;
}

} // namespace review
