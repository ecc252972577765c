#include <shccn/cli_exit_codes.h>
#include <shccn/shccn_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: shccn <command> [options]\n\n"
      << "Commands:\n"
      << "  analyze   Report line counts and per-function CCN for shell "
         "scripts\n"
      << "            (default if no command is given).\n\n"
      << "Run 'shccn analyze --help' for analysis options.\n";
}
}

int main(int argc, char **argv) {
  try {
    std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return shccn::kExitSuccess;
    }

    if (!arguments.empty() && arguments.front() == "analyze") {
      arguments.erase(arguments.begin());
    }
    return shccn::RunAnalyze(arguments);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return shccn::kExitUsageError;
  }
}
