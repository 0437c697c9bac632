#include "core/task_list.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

using core::Task;
using core::TaskList;

std::size_t RequireTaskNumber(const TaskList& tasks, std::size_t number) {
  if (number < 1 || number > tasks.size()) {
    throw std::invalid_argument("Task not found.");
  }
  return number - 1;
}

}  // namespace

namespace core {

std::string TrimWhitespace(const std::string& value) {
  std::size_t start = 0;
  std::size_t end = value.size();
  while (start < value.size() &&
         std::isspace(static_cast<unsigned char>(value[start])) != 0) {
    ++start;
  }
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return value.substr(start, end - start);
}

StatusMessage AddTask(TaskList& tasks, const std::string& text) {
  const std::string trimmed = TrimWhitespace(text);
  if (trimmed.empty()) {
    throw std::invalid_argument("Task cannot be empty.");
  }
  if (trimmed.find_first_of("\r\n") != std::string::npos) {
    throw std::invalid_argument("Task must fit on a single line.");
  }
  tasks.push_back(Task{trimmed, false});
  return Success("Added: " + trimmed);
}

StatusMessage CheckTask(TaskList& tasks, std::size_t number) {
  auto& task = tasks[RequireTaskNumber(tasks, number)];
  if (task.done) {
    return Warning("Task #" + std::to_string(number) + " is already completed.");
  }
  task.done = true;
  return Success("Checked off task #" + std::to_string(number));
}

StatusMessage DeleteTask(TaskList& tasks, std::size_t number) {
  const auto index = RequireTaskNumber(tasks, number);
  const std::string text = tasks[index].text;
  tasks.erase(tasks.begin() + static_cast<TaskList::difference_type>(index));
  return Success("Deleted: " + text);
}

StatusMessage ClearDone(TaskList& tasks) {
  const auto before = tasks.size();
  tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                             [](const Task& task) { return task.done; }),
              tasks.end());
  return Success("Cleared " + std::to_string(before - tasks.size()) + " completed task(s).");
}

}  // namespace core
