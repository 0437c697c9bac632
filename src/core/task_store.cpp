#include "core/task_store.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "core/logging.hpp"
#include "core/task_markdown.hpp"

namespace {

namespace fs = std::filesystem;

using core::logging::LogDebug;
using core::logging::LogInfo;
using core::logging::LogWarn;

std::string ErrnoText() {
  const int err = errno;
  return err != 0 ? std::strerror(err) : "unknown error";
}

void RemoveQuietly(const std::string& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    LogWarn("Failed to remove " + path + ": " + ec.message());
  }
}

}  // namespace

namespace core {

TaskStore::TaskStore(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("Task file path cannot be empty.");
  }
}

TaskList TaskStore::Load() const {
  std::error_code ec;
  const auto status = fs::status(path_, ec);
  if (status.type() == fs::file_type::not_found) {
    LogDebug("No task file at " + path_ + "; starting with an empty list.");
    return {};
  }
  if (ec) {
    throw std::runtime_error("Failed to stat " + path_ + ": " + ec.message());
  }
  if (fs::is_directory(status)) {
    throw std::runtime_error("Failed to read " + path_ + ": is a directory");
  }

  errno = 0;
  std::ifstream input(path_, std::ios::in | std::ios::binary);
  if (!input) {
    throw std::runtime_error("Failed to open " + path_ + ": " + ErrnoText());
  }

  std::ostringstream buffer;
  buffer << input.rdbuf();
  if (input.bad()) {
    throw std::runtime_error("Failed to read " + path_);
  }

  auto tasks = markdown::ParseTaskMarkdown(buffer.str());
  LogInfo("Loaded " + std::to_string(tasks.size()) + " task(s) from " + path_);
  return tasks;
}

void TaskStore::Save(const TaskList& tasks) const {
  const std::string content = markdown::ExportTaskMarkdown(tasks);
  const std::string target = ResolveTarget();
  const std::string temp_path = target + ".tmp";

  {
    errno = 0;
    std::ofstream output(temp_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output) {
      throw std::runtime_error("Failed to open " + temp_path + " for writing: " + ErrnoText());
    }
    output << content;
    output.flush();
    if (!output) {
      const auto reason = ErrnoText();
      output.close();
      RemoveQuietly(temp_path);
      throw std::runtime_error("Failed to write " + temp_path + ": " + reason);
    }
  }

  std::error_code ec;
  const auto target_status = fs::status(target, ec);
  if (!ec && fs::is_regular_file(target_status)) {
    fs::permissions(temp_path, target_status.permissions(), ec);
    if (ec) {
      LogWarn("Failed to copy permissions of " + target + ": " + ec.message());
    }
  }

  ec.clear();
  fs::rename(temp_path, target, ec);
  if (ec) {
    RemoveQuietly(temp_path);
    throw std::runtime_error("Failed to replace " + target + ": " + ec.message());
  }

  LogDebug("Saved " + std::to_string(tasks.size()) + " task(s) to " + path_);
}

std::string TaskStore::ResolveTarget() const {
  std::error_code ec;
  if (!fs::is_symlink(path_, ec)) {
    return path_;
  }
  const auto resolved = fs::weakly_canonical(path_, ec);
  if (ec) {
    throw std::runtime_error("Failed to resolve link " + path_ + ": " + ec.message());
  }
  return resolved.string();
}

}  // namespace core
