#ifndef REVIEW_TEST_SUPPORT_TEMPORARY_DIRECTORY_H
#define REVIEW_TEST_SUPPORT_TEMPORARY_DIRECTORY_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace review {
namespace test {

class TemporaryDirectory {
public:
  TemporaryDirectory() {
    static std::atomic<int> counter{0};
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("diff-review-" + std::to_string(timestamp) + "-" +
             std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }

  ~TemporaryDirectory() {
    std::error_code error;
    std::filesystem::remove_all(root_, error);
  }

  TemporaryDirectory(const TemporaryDirectory &) = delete;
  TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

  std::filesystem::path AddFile(const std::filesystem::path &relative,
                                const std::string &content = "") const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path.parent_path());
    std::ofstream stream(full_path, std::ios::binary);
    stream << content;
    return full_path;
  }

  // Writes a shell script and marks it executable.
  std::filesystem::path AddScript(const std::filesystem::path &relative,
                                  const std::string &body) const {
    const auto full_path = AddFile(relative, "#!/bin/sh\n" + body);
    std::filesystem::permissions(full_path,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec,
                                 std::filesystem::perm_options::replace);
    return full_path;
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace test
} // namespace review

#endif // REVIEW_TEST_SUPPORT_TEMPORARY_DIRECTORY_H
