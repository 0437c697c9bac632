#pragma once

#include <string>
#include <utility>

namespace core {

enum class Severity { kInfo = 0, kSuccess, kWarning, kError };

// One line shown under the task list on the next redraw, then discarded.
struct StatusMessage {
  Severity severity = Severity::kInfo;
  std::string text;

  bool empty() const { return text.empty(); }
};

inline StatusMessage Success(std::string text) {
  return StatusMessage{Severity::kSuccess, std::move(text)};
}

inline StatusMessage Warning(std::string text) {
  return StatusMessage{Severity::kWarning, std::move(text)};
}

inline StatusMessage Failure(std::string text) {
  return StatusMessage{Severity::kError, std::move(text)};
}

}  // namespace core
