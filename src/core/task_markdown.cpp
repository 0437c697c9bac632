#include "core/task_markdown.hpp"

#include <sstream>
#include <utility>

#include "core/logging.hpp"

namespace {

constexpr char kOpenPrefix[] = "- [ ] ";
constexpr char kDonePrefixLower[] = "- [x] ";
constexpr char kDonePrefixUpper[] = "- [X] ";
constexpr std::size_t kPrefixLength = sizeof(kOpenPrefix) - 1;

bool StartsWith(const std::string& value, const char* prefix) {
  return value.compare(0, kPrefixLength, prefix) == 0;
}

}  // namespace

namespace core::markdown {

std::optional<Task> ParseTaskLine(const std::string& line) {
  std::string current = line;
  if (!current.empty() && current.back() == '\r') {
    current.pop_back();
  }
  if (current.size() <= kPrefixLength) {
    return std::nullopt;
  }

  Task task;
  if (StartsWith(current, kOpenPrefix)) {
    task.done = false;
  } else if (StartsWith(current, kDonePrefixLower) || StartsWith(current, kDonePrefixUpper)) {
    task.done = true;
  } else {
    return std::nullopt;
  }

  task.text = current.substr(kPrefixLength);
  if (TrimWhitespace(task.text).empty()) {
    return std::nullopt;
  }
  return task;
}

TaskList ParseTaskMarkdown(const std::string& content) {
  TaskList tasks;
  std::size_t ignored = 0;

  std::string line;
  std::istringstream stream(content);
  while (std::getline(stream, line)) {
    if (auto task = ParseTaskLine(line)) {
      tasks.push_back(std::move(*task));
    } else if (!TrimWhitespace(line).empty()) {
      ++ignored;
    }
  }

  if (ignored > 0) {
    core::logging::LogDebug("Ignored " + std::to_string(ignored) +
                            " non-task line(s) in Markdown; they will not be saved.");
  }
  return tasks;
}

std::string ExportTaskMarkdown(const TaskList& tasks) {
  std::ostringstream out;
  for (const auto& task : tasks) {
    out << (task.done ? kDonePrefixLower : kOpenPrefix) << task.text << "\n";
  }
  return out.str();
}

}  // namespace core::markdown
