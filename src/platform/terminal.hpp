#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "core/status_message.hpp"
#include "core/task_list.hpp"

namespace platform {

// Draws one frame of the shell. Implementations must not throw; a frame that
// fails to draw is logged and skipped.
class Renderer {
 public:
  virtual ~Renderer() = default;
  virtual void Render(const core::TaskList& tasks, const core::StatusMessage& status) = 0;
};

class TerminalRenderer : public Renderer {
 public:
  TerminalRenderer(std::ostream& out, bool use_color);

  void Render(const core::TaskList& tasks, const core::StatusMessage& status) override;

 private:
  std::string Paint(const std::string& text, const char* style) const;
  std::string FormatFrame(const core::TaskList& tasks, const core::StatusMessage& status) const;

  std::ostream& out_;
  bool use_color_;
};

// Keeps every frame in memory instead of drawing it.
class CaptureRenderer : public Renderer {
 public:
  struct Frame {
    core::TaskList tasks;
    core::StatusMessage status;
  };

  void Render(const core::TaskList& tasks, const core::StatusMessage& status) override;

  const std::vector<Frame>& frames() const { return frames_; }

 private:
  std::vector<Frame> frames_;
};

// Plain numbered listing, one task per line, used by `smallt list`.
std::string FormatTaskListing(const core::TaskList& tasks);

}  // namespace platform
