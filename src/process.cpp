#include <review/process.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace review {
namespace {

class Pipe {
public:
  Pipe() {
    if (pipe(fds_.data()) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe");
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  int read_end() const { return fds_[0]; }
  int write_end() const { return fds_[1]; }
  void CloseRead() { Close(fds_[0]); }
  void CloseWrite() { Close(fds_[1]); }

private:
  static void Close(int &fd) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }

  std::array<int, 2> fds_{-1, -1};
};

void IgnoreBrokenPipes() {
  static const bool installed = [] {
    std::signal(SIGPIPE, SIG_IGN);
    return true;
  }();
  (void)installed;
}

[[noreturn]] void ExecChild(const std::vector<std::string> &arguments,
                            const ProcessOptions &options, Pipe &input,
                            Pipe &output, Pipe &error) {
  dup2(input.read_end(), STDIN_FILENO);
  dup2(output.write_end(), STDOUT_FILENO);
  dup2(error.write_end(), STDERR_FILENO);
  input.CloseRead();
  input.CloseWrite();
  output.CloseRead();
  output.CloseWrite();
  error.CloseRead();
  error.CloseWrite();

  if (!options.working_directory.empty() &&
      chdir(options.working_directory.c_str()) != 0) {
    _exit(127);
  }
  for (const auto &[name, value] : options.environment) {
    setenv(name.c_str(), value.c_str(), 1);
  }

  std::vector<char *> argv;
  argv.reserve(arguments.size() + 1);
  for (const auto &argument : arguments) {
    argv.push_back(const_cast<char *>(argument.c_str()));
  }
  argv.push_back(nullptr);
  execvp(argv[0], argv.data());
  _exit(127);
}

void PumpChildStreams(const std::string &input, Pipe &input_pipe,
                      Pipe &output_pipe, Pipe &error_pipe,
                      ProcessResult &result) {
  std::size_t written = 0;
  if (input.empty()) {
    input_pipe.CloseWrite();
  } else {
    fcntl(input_pipe.write_end(), F_SETFL, O_NONBLOCK);
  }

  std::array<char, 4096> buffer{};
  while (input_pipe.write_end() >= 0 || output_pipe.read_end() >= 0 ||
         error_pipe.read_end() >= 0) {
    std::array<pollfd, 3> fds{};
    fds[0] = {input_pipe.write_end(), POLLOUT, 0};
    fds[1] = {output_pipe.read_end(), POLLIN, 0};
    fds[2] = {error_pipe.read_end(), POLLIN, 0};

    if (poll(fds.data(), fds.size(), -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "poll");
    }

    if (fds[0].revents != 0) {
      if ((fds[0].revents & POLLOUT) != 0) {
        const auto count = write(input_pipe.write_end(), input.data() + written,
                                 input.size() - written);
        if (count > 0) {
          written += static_cast<std::size_t>(count);
        }
        if (written == input.size() ||
            (count < 0 && errno != EAGAIN && errno != EINTR)) {
          input_pipe.CloseWrite();
        }
      } else {
        // The child closed its stdin before consuming everything.
        input_pipe.CloseWrite();
      }
    }

    const auto drain = [&](const pollfd &fd, Pipe &pipe, std::string &sink) {
      if (fd.revents == 0) {
        return;
      }
      const auto count = read(pipe.read_end(), buffer.data(), buffer.size());
      if (count > 0) {
        sink.append(buffer.data(), static_cast<std::size_t>(count));
      } else if (count == 0 || (errno != EAGAIN && errno != EINTR)) {
        pipe.CloseRead();
      }
    };
    drain(fds[1], output_pipe, result.stdout_output);
    drain(fds[2], error_pipe, result.stderr_output);
  }
}

int WaitForChild(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return -WTERMSIG(status);
  }
  return -1;
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string> &arguments,
                         const ProcessOptions &options) {
  if (arguments.empty()) {
    throw std::invalid_argument("RunProcess requires a program to run");
  }
  IgnoreBrokenPipes();

  Pipe input;
  Pipe output;
  Pipe error;

  const pid_t pid = fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }
  if (pid == 0) {
    ExecChild(arguments, options, input, output, error);
  }

  input.CloseRead();
  output.CloseWrite();
  error.CloseWrite();

  ProcessResult result;
  PumpChildStreams(options.stdin_input, input, output, error, result);
  result.exit_code = WaitForChild(pid);
  return result;
}

ProcessResult RunShellCommand(const std::string &command,
                              const ProcessOptions &options) {
  return RunProcess({"/bin/sh", "-c", command}, options);
}

std::optional<std::filesystem::path> FindExecutable(const std::string &name) {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    if (access(name.c_str(), X_OK) == 0) {
      return std::filesystem::path(name);
    }
    return std::nullopt;
  }

  const char *path_variable = std::getenv("PATH");
  if (path_variable == nullptr) {
    return std::nullopt;
  }
  const std::string search_path(path_variable);
  std::string::size_type start = 0;
  while (start <= search_path.size()) {
    auto end = search_path.find(':', start);
    if (end == std::string::npos) {
      end = search_path.size();
    }
    const auto directory = search_path.substr(start, end - start);
    const auto candidate =
        std::filesystem::path(directory.empty() ? "." : directory) / name;
    std::error_code error;
    if (std::filesystem::is_regular_file(candidate, error) &&
        access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
    start = end + 1;
  }
  return std::nullopt;
}

} // namespace review
