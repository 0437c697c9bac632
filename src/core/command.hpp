#pragma once

#include <cstddef>
#include <string>

#include "core/status_message.hpp"
#include "core/task_list.hpp"

namespace core {

class TaskStore;

enum class CommandKind { kEmpty = 0, kAdd, kCheck, kDelete, kClear, kList, kExit, kUnknown };

struct Command {
  CommandKind kind = CommandKind::kEmpty;
  // For kUnknown this holds the unrecognized keyword.
  std::string keyword;
  std::string argument;
};

// Everything the interactive loop carries between iterations.
struct ShellState {
  TaskList tasks;
  StatusMessage status;
};

Command ParseCommand(const std::string& line);

// Accepts an optionally signed decimal integer and nothing else. Range
// checking is left to the list operations, so "0" and "-1" parse.
long long ParseTaskNumber(const std::string& argument);

// Applies one command to `state`. Mutating commands save through `store`
// before the new list replaces state.tasks, so a rejected command or a failed
// save leaves the list as it was. Returns false once the shell should stop.
bool ApplyCommand(ShellState& state, const Command& command, const TaskStore& store);

std::string CommandLegend();

}  // namespace core
