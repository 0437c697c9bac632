#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "core/app.hpp"
#include "core/logging.hpp"
#include "core/task_store.hpp"
#include "platform/terminal.hpp"

int main(int argc, char** argv) {
  core::logging::InitializeFromEnvironment();
  const auto config = core::LoadAppConfig();

  std::ofstream log_file;
  if (!config.log_file.empty()) {
    log_file.open(config.log_file, std::ios::app);
    if (log_file) {
      core::logging::SetLogStream(&log_file);
    } else {
      core::logging::LogWarn("Cannot open log file " + config.log_file + "; logging to stderr.");
    }
  }

  try {
    core::TaskStore store(config.task_file);

    const std::vector<std::string> args(argv + 1, argv + argc);
    if (!args.empty()) {
      return core::RunOneShot(args, store, std::cout);
    }

    platform::TerminalRenderer renderer(std::cout, config.use_color);
    return core::RunInteractive(store, renderer, std::cin, std::cout);
  } catch (const std::exception& ex) {
    core::logging::LogError(std::string{"smallt failed: "} + ex.what());
    std::cerr << "smallt: " << ex.what() << std::endl;
    return 1;
  }
}
