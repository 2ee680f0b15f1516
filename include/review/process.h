#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace review {

struct ProcessOptions {
  std::filesystem::path working_directory;
  std::string stdin_input;
  std::vector<std::pair<std::string, std::string>> environment;
};

struct ProcessResult {
  // Exit status, or the negated signal number when the child was killed.
  int exit_code = -1;
  std::string stdout_output;
  std::string stderr_output;
};

// Runs |arguments| (resolved through PATH) and waits for it. stdin, stdout
// and stderr are serviced together so large payloads cannot deadlock.
// Throws std::system_error when the child cannot be started.
ProcessResult RunProcess(const std::vector<std::string> &arguments,
                         const ProcessOptions &options = {});

// Runs |command| through /bin/sh -c.
ProcessResult RunShellCommand(const std::string &command,
                              const ProcessOptions &options = {});

std::optional<std::filesystem::path> FindExecutable(const std::string &name);

} // namespace review
