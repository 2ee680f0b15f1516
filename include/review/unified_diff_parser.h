#pragma once

#include <review/interfaces.h>
#include <review/logging.h>
#include <review/models.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace review {

class DiffUnreadable : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

const std::vector<std::string> &DefaultSupportedExtensions();

class UnifiedDiffParser {
public:
  explicit UnifiedDiffParser(
      std::vector<std::string> supported_extensions =
          DefaultSupportedExtensions(),
      std::shared_ptr<Logger> logger = nullptr);

  ParsedDiff Parse(const std::string &text,
                   const std::optional<DiffStat> &stat = std::nullopt) const;
  ParsedDiff ParseFile(const std::filesystem::path &path) const;
  ParsedDiff ParseCommit(DiffProvider &provider, const std::string &commit,
                         const std::optional<std::string> &base =
                             std::nullopt) const;

  bool IsSupported(const std::string &path) const;
  const std::vector<std::string> &SupportedExtensions() const {
    return supported_extensions_;
  }

private:
  std::vector<std::string> supported_extensions_;
  std::shared_ptr<Logger> logger_;
};

} // namespace review
