#pragma once

#include <string>

#include "core/task_list.hpp"

namespace core {

constexpr char kDefaultTaskFile[] = "tasks.md";

// Owns the Markdown file backing a TaskList. I/O failures are reported as
// std::runtime_error.
class TaskStore {
 public:
  explicit TaskStore(std::string path);

  TaskStore(const TaskStore&) = delete;
  TaskStore& operator=(const TaskStore&) = delete;

  // A missing file is an empty list, not an error.
  TaskList Load() const;

  // Replaces the file through a temp file and rename, so a failed save
  // leaves the previous contents in place. A symlinked path is written
  // through to its target and the target keeps its permission bits.
  void Save(const TaskList& tasks) const;

  const std::string& path() const { return path_; }

 private:
  std::string ResolveTarget() const;

  std::string path_;
};

}  // namespace core
