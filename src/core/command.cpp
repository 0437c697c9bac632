#include "core/command.hpp"

#include <cctype>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "core/logging.hpp"
#include "core/task_store.hpp"

namespace core {
namespace {

using core::logging::LogDebug;
using core::logging::LogWarn;

struct CommandEntry {
  std::string_view keyword;
  CommandKind kind;
  std::string_view usage;
  std::string_view description;
};

const std::vector<CommandEntry> kCommandCatalog = {
    {"add", CommandKind::kAdd, "add <task>", "Add a new task"},
    {"check", CommandKind::kCheck, "check <number>", "Mark task as complete"},
    {"delete", CommandKind::kDelete, "delete <number>", "Delete a specific task"},
    {"clear", CommandKind::kClear, "clear", "Remove completed tasks"},
    {"list", CommandKind::kList, "list", "Refresh task list"},
    {"exit", CommandKind::kExit, "exit", "Quit program"},
};

bool IsSpace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

std::size_t ToTaskNumber(long long value) {
  return value < 1 ? 0 : static_cast<std::size_t>(value);
}

// Runs `mutation` on a copy of the list and only commits it once saved.
template <typename Mutation>
void MutateAndSave(ShellState& state, const TaskStore& store, Mutation mutation) {
  TaskList updated = state.tasks;
  StatusMessage status;
  try {
    status = mutation(updated);
  } catch (const std::invalid_argument& ex) {
    LogDebug(std::string{"Rejected command: "} + ex.what());
    state.status = Failure(ex.what());
    return;
  }

  try {
    store.Save(updated);
  } catch (const std::runtime_error& ex) {
    LogWarn(std::string{"Save failed: "} + ex.what());
    state.status = Failure(std::string{"Failed to save changes: "} + ex.what());
    return;
  }

  state.tasks = std::move(updated);
  state.status = std::move(status);
}

}  // namespace

Command ParseCommand(const std::string& line) {
  std::size_t start = 0;
  while (start < line.size() && IsSpace(line[start])) {
    ++start;
  }
  if (start == line.size()) {
    return Command{};
  }

  std::size_t end = start;
  while (end < line.size() && !IsSpace(line[end])) {
    ++end;
  }

  Command command;
  command.keyword = line.substr(start, end - start);
  if (end < line.size()) {
    command.argument = line.substr(end + 1);
  }
  if (!command.argument.empty() && command.argument.back() == '\r') {
    command.argument.pop_back();
  }

  command.kind = CommandKind::kUnknown;
  for (const auto& entry : kCommandCatalog) {
    if (entry.keyword == command.keyword) {
      command.kind = entry.kind;
      break;
    }
  }
  return command;
}

long long ParseTaskNumber(const std::string& argument) {
  const std::string value = TrimWhitespace(argument);
  std::size_t pos = 0;
  if (!value.empty() && (value[0] == '-' || value[0] == '+')) {
    pos = 1;
  }
  if (pos == value.size()) {
    throw std::invalid_argument("Invalid number.");
  }
  for (std::size_t i = pos; i < value.size(); ++i) {
    if (std::isdigit(static_cast<unsigned char>(value[i])) == 0) {
      throw std::invalid_argument("Invalid number.");
    }
  }
  try {
    return std::stoll(value);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Invalid number.");
  }
}

bool ApplyCommand(ShellState& state, const Command& command, const TaskStore& store) {
  switch (command.kind) {
    case CommandKind::kList:
      return true;

    case CommandKind::kEmpty:
      state.status = Failure("Unknown command: (empty)");
      return true;

    case CommandKind::kExit:
      return false;

    case CommandKind::kUnknown:
      LogDebug("Unknown command: " + command.keyword);
      state.status = Failure("Unknown command: " + command.keyword);
      return true;

    case CommandKind::kAdd:
      MutateAndSave(state, store,
                    [&command](TaskList& tasks) { return AddTask(tasks, command.argument); });
      return true;

    case CommandKind::kCheck:
      MutateAndSave(state, store, [&command](TaskList& tasks) {
        return CheckTask(tasks, ToTaskNumber(ParseTaskNumber(command.argument)));
      });
      return true;

    case CommandKind::kDelete:
      MutateAndSave(state, store, [&command](TaskList& tasks) {
        return DeleteTask(tasks, ToTaskNumber(ParseTaskNumber(command.argument)));
      });
      return true;

    case CommandKind::kClear:
      MutateAndSave(state, store, [](TaskList& tasks) { return ClearDone(tasks); });
      return true;
  }
  return true;
}

std::string CommandLegend() {
  std::string legend;
  for (const auto& entry : kCommandCatalog) {
    std::string usage{entry.usage};
    usage.resize(18, ' ');
    legend.append("  ");
    legend.append(usage);
    legend.append(entry.description);
    legend.append("\n");
  }
  return legend;
}

}  // namespace core
