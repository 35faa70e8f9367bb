#include <iostream>
#include <string>
#include <vector>

#include "commands.hpp"
#include "console.hpp"
#include "dispatcher.hpp"
#include "parser.hpp"

namespace {

// memsched CONFIG [baseline|memory-aware|compare] [REPORT_FILE]
int run_once(int argc, char** argv) {
  using namespace memsched;

  Session session;
  dispatch(Commands::Initialize, {argv[1]}, session);
  if (!session.config) {
    return 1;
  }
  std::string scenario = argc > 2 ? argv[2] : "compare";
  if (!is_scenario(scenario)) {
    std::cerr << "Error: expected baseline, memory-aware or compare, got '"
              << scenario << "'\n";
    return 2;
  }
  dispatch(from_str(scenario), {}, session);
  if (argc > 3) {
    dispatch(Commands::ReportUtil, {argv[3]}, session);
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace memsched;

  if (argc > 1) {
    try {
      return run_once(argc, argv);
    } catch (const std::exception& ex) {
      std::cerr << "Error: " << ex.what() << '\n';
      return 1;
    }
  }

  Session session;
  console_prompt();

  std::string line;
  while (std::cout << "~ " << std::flush && std::getline(std::cin, line)) {
    auto tokens = ParseTokens(line);
    if (tokens.empty()) continue;

    try {
      Commands cmd = from_str(tokens.front());
      tokens.erase(tokens.begin());
      dispatch(cmd, tokens, session);

      if (cmd == Commands::Exit) {
        break;
      }
    } catch (const std::invalid_argument& ex) {
      std::cerr << "Error: " << ex.what() << '\n';
    } catch (const std::exception& ex) {
      std::cerr << "An unexpected error occurred: " << ex.what() << '\n';
    }
  }

  std::cout << "Simulator has shut down cleanly." << std::endl;
  return 0;
}
