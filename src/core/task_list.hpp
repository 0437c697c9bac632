#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/status_message.hpp"

namespace core {

struct Task {
  std::string text;
  bool done = false;
};

inline bool operator==(const Task& a, const Task& b) {
  return a.text == b.text && a.done == b.done;
}

inline bool operator!=(const Task& a, const Task& b) { return !(a == b); }

// Display order, persisted order and insertion order are the same thing.
// A task's number is its 1-based position.
using TaskList = std::vector<Task>;

// The mutations below return a status line for the user and throw
// std::invalid_argument without touching `tasks` when the input is rejected.
StatusMessage AddTask(TaskList& tasks, const std::string& text);
StatusMessage CheckTask(TaskList& tasks, std::size_t number);
StatusMessage DeleteTask(TaskList& tasks, std::size_t number);
StatusMessage ClearDone(TaskList& tasks);

std::string TrimWhitespace(const std::string& value);

}  // namespace core
