#include "core/app.hpp"

#include <cstdlib>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

#include "core/logging.hpp"
#include "nlohmann/json.hpp"
#include "platform/terminal.hpp"

namespace core {
namespace {

using core::logging::LogDebug;
using core::logging::LogError;
using core::logging::LogInfo;
using nlohmann::json;

json TasksToJson(const TaskList& tasks) {
  json payload = json::array();
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    payload.push_back({{"number", i + 1}, {"text", tasks[i].text}, {"done", tasks[i].done}});
  }
  return payload;
}

std::string JoinWords(const std::vector<std::string>& args, std::size_t first) {
  std::string joined;
  for (std::size_t i = first; i < args.size(); ++i) {
    if (!joined.empty()) {
      joined.append(" ");
    }
    joined.append(args[i]);
  }
  return joined;
}

bool IsFalse(const std::string& value) {
  return value == "0" || value == "false" || value == "FALSE";
}

}  // namespace

AppConfig LoadAppConfig() {
  AppConfig config;
  if (const char* path = std::getenv("SMALLT_TASK_FILE")) {
    if (*path != '\0') {
      config.task_file = path;
    }
  }
  if (const char* log_file = std::getenv("SMALLT_LOG_FILE")) {
    config.log_file = log_file;
  }
  if (const char* color = std::getenv("SMALLT_COLOR")) {
    if (IsFalse(color)) {
      config.use_color = false;
    }
  }
  if (std::getenv("NO_COLOR") != nullptr) {
    config.use_color = false;
  }
  return config;
}

bool RunShell(ShellState& state, const TaskStore& store, platform::Renderer& renderer,
              std::istream& input) {
  std::string line;
  bool end_of_input = false;
  while (true) {
    renderer.Render(state.tasks, state.status);
    state.status = StatusMessage{};

    if (!std::getline(input, line)) {
      LogDebug("End of input; leaving shell.");
      end_of_input = true;
      break;
    }
    if (!ApplyCommand(state, ParseCommand(line), store)) {
      break;
    }
  }
  LogInfo("Shell finished with " + std::to_string(state.tasks.size()) + " task(s).");
  return end_of_input;
}

int RunInteractive(const TaskStore& store, platform::Renderer& renderer, std::istream& input,
                   std::ostream& out) {
  ShellState state;
  try {
    state.tasks = store.Load();
  } catch (const std::runtime_error& ex) {
    LogError("Cannot start with " + store.path() + ": " + ex.what());
    out << "Error: " << ex.what() << "\n";
    return 1;
  }

  if (RunShell(state, store, renderer, input)) {
    out << "\nGoodbye!" << std::endl;
  }
  return 0;
}

int RunOneShot(const std::vector<std::string>& args, const TaskStore& store, std::ostream& out) {
  if (args.empty()) {
    out << UsageText();
    return 2;
  }

  const std::string& verb = args.front();
  if (verb == "help" || verb == "-h" || verb == "--help") {
    out << UsageText();
    return 0;
  }

  try {
    if (verb == "add") {
      auto tasks = store.Load();
      StatusMessage status;
      try {
        status = AddTask(tasks, JoinWords(args, 1));
      } catch (const std::invalid_argument& ex) {
        out << ex.what() << "\n";
        return 2;
      }
      store.Save(tasks);
      out << status.text << "\n";
      return 0;
    }
    if (verb == "list") {
      out << platform::FormatTaskListing(store.Load());
      return 0;
    }
    if (verb == "export") {
      out << TasksToJson(store.Load()).dump(2) << "\n";
      return 0;
    }
  } catch (const std::runtime_error& ex) {
    LogError(ex.what());
    out << "Error: " << ex.what() << "\n";
    return 1;
  }

  out << "Unknown command: " << verb << "\n" << UsageText();
  return 2;
}

std::string UsageText() {
  return "smallt - A tiny task manager\n"
         "\n"
         "Usage:\n"
         "  smallt                Launch interactive mode\n"
         "  smallt add <task>     Add a task\n"
         "  smallt list           Show all tasks\n"
         "  smallt export         Print all tasks as JSON\n"
         "  smallt help           Show this help\n";
}

}  // namespace core
