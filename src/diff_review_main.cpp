#include <review/diff_review.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: diff-review <command> [options]\n\n"
      << "Commands:\n"
      << "  review    Run the review stages over a commit or diff file\n"
      << "            (default if no command is given).\n"
      << "  extract   Collect the checked findings of a markdown report.\n\n"
      << "Run 'diff-review <command> --help' for command options.\n";
}
}

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return 0;
    }

    std::string command = "review";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "review") {
      return review::RunReview(command_arguments);
    }

    if (command == "extract") {
      return review::RunExtract(command_arguments);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return 1;
  }
}
