#pragma once

#include <review/interfaces.h>
#include <review/logging.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace review {

// Object name of the tree with no entries; every git repository knows it.
inline constexpr char kEmptyTreeSha[] =
    "4b825dc642cb6eb9a060e54bf8d69288fbee4904";

// Parses `git diff --shortstat` output such as
// " 3 files changed, 10 insertions(+), 2 deletions(-)".
DiffStat ParseShortStat(const std::string &output);

class GitDiffSource : public DiffProvider {
public:
  explicit GitDiffSource(std::filesystem::path repository = ".",
                         std::shared_ptr<Logger> logger = nullptr);

  DiffText Diff(const std::string &commit,
                const std::optional<std::string> &base) override;

  // Parent of |commit|, or the empty tree when |commit| is a root commit.
  std::string ResolveBase(const std::string &commit);

private:
  std::string Git(const std::vector<std::string> &arguments);

  std::filesystem::path repository_;
  std::shared_ptr<Logger> logger_;
};

} // namespace review
