#include "platform/terminal.hpp"

#include <exception>
#include <ostream>
#include <sstream>

#include "core/command.hpp"
#include "core/logging.hpp"

namespace {

constexpr char kClearScreen[] = "\033[2J\033[H";
constexpr char kReset[] = "\033[0m";

constexpr char kHeaderStyle[] = "\033[1m\033[94m";
constexpr char kBorderStyle[] = "\033[34m";
constexpr char kNumberStyle[] = "\033[1m\033[94m";
constexpr char kDoneStyle[] = "\033[2m\033[90m";
constexpr char kLegendStyle[] = "\033[1m\033[96m";
constexpr char kHintStyle[] = "\033[2m\033[36m";

constexpr char kBorder[] = "===========================================";

const char* SeverityStyle(core::Severity severity) {
  switch (severity) {
    case core::Severity::kSuccess:
      return "\033[92m";
    case core::Severity::kWarning:
      return "\033[93m";
    case core::Severity::kError:
      return "\033[91m";
    case core::Severity::kInfo:
      return "\033[36m";
  }
  return "";
}

std::string TaskLine(std::size_t number, const core::Task& task) {
  return std::to_string(number) + ". " + (task.done ? "[x] " : "[ ] ") + task.text;
}

}  // namespace

namespace platform {

TerminalRenderer::TerminalRenderer(std::ostream& out, bool use_color)
    : out_(out), use_color_(use_color) {}

void TerminalRenderer::Render(const core::TaskList& tasks, const core::StatusMessage& status) {
  try {
    const std::string frame = FormatFrame(tasks, status);
    out_ << kClearScreen << frame << std::flush;
  } catch (const std::exception& ex) {
    core::logging::LogWarn(std::string{"Failed to draw screen: "} + ex.what());
  }
  if (!out_) {
    core::logging::LogWarn("Terminal output stream is in a failed state; resetting it.");
    out_.clear();
  }
}

std::string TerminalRenderer::Paint(const std::string& text, const char* style) const {
  if (!use_color_) {
    return text;
  }
  return style + text + kReset;
}

std::string TerminalRenderer::FormatFrame(const core::TaskList& tasks,
                                          const core::StatusMessage& status) const {
  std::ostringstream frame;
  frame << Paint(kBorder, kBorderStyle) << "\n";
  frame << Paint("           smallt task manager", kHeaderStyle) << "\n";
  frame << Paint(kBorder, kBorderStyle) << "\n\n";

  if (tasks.empty()) {
    frame << Paint("   No tasks yet. Add one to get started!", kHintStyle) << "\n";
  }
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    const auto& task = tasks[i];
    frame << Paint(std::to_string(i + 1) + ".", kNumberStyle) << " ";
    const std::string body = std::string{task.done ? "[x] " : "[ ] "} + task.text;
    frame << (task.done ? Paint(body, kDoneStyle) : body) << "\n";
  }

  if (!status.empty()) {
    frame << "\n" << Paint(status.text, SeverityStyle(status.severity)) << "\n";
  }

  frame << "\n" << Paint("Commands:", kLegendStyle) << "\n";
  frame << core::CommandLegend();
  frame << "\n" << Paint(">", kNumberStyle) << " ";
  return frame.str();
}

void CaptureRenderer::Render(const core::TaskList& tasks, const core::StatusMessage& status) {
  frames_.push_back(Frame{tasks, status});
}

std::string FormatTaskListing(const core::TaskList& tasks) {
  if (tasks.empty()) {
    return "No tasks yet.\n";
  }
  std::string listing;
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    listing.append(TaskLine(i + 1, tasks[i]));
    listing.append("\n");
  }
  return listing;
}

}  // namespace platform
