#pragma once

#include <optional>
#include <string>

#include "core/task_list.hpp"

namespace core::markdown {

// Classifies one line: a checkbox line yields its Task, anything else nullopt.
std::optional<Task> ParseTaskLine(const std::string& line);

// Lines that are not checkbox lines are dropped.
TaskList ParseTaskMarkdown(const std::string& content);

std::string ExportTaskMarkdown(const TaskList& tasks);

}  // namespace core::markdown
