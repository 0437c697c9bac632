#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "core/command.hpp"
#include "core/task_list.hpp"
#include "core/task_store.hpp"

namespace platform {
class Renderer;
}  // namespace platform

namespace core {

struct AppConfig {
  std::string task_file = kDefaultTaskFile;
  std::string log_file;
  bool use_color = true;
};

AppConfig LoadAppConfig();

// Render, read a line, apply it; until `exit` or end of input. Returns true
// when the loop stopped at end of input rather than on `exit`.
bool RunShell(ShellState& state, const TaskStore& store, platform::Renderer& renderer,
              std::istream& input);

// Loads the store and runs the shell. Returns 1 when the task file cannot be
// loaded, 0 otherwise.
int RunInteractive(const TaskStore& store, platform::Renderer& renderer, std::istream& input,
                   std::ostream& out);

// Handles `smallt <args...>`. Returns the process exit code.
int RunOneShot(const std::vector<std::string>& args, const TaskStore& store, std::ostream& out);

std::string UsageText();

}  // namespace core
