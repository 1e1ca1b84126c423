#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "tasknag/common.hpp"

namespace tasknag::notify {

// Where reminders become visible to the user
class PresentationSink {
 public:
  virtual ~PresentationSink() = default;

  virtual Result<void> showAlert(const std::string& title, const std::string& body) = 0;

  // Best-effort audible cue
  virtual Result<void> playCue() = 0;

  // Best-effort request to raise the application window
  virtual Result<void> bringToFront() = 0;
};

/**
 * @brief Desktop notifications through external tools
 *
 * Alerts go through notify-send (or a compatible notifier), the cue through a
 * sound player command and window focus through an optional command such as
 * wmctrl. All commands run via SafeProcess without a shell.
 */
class DesktopPresentationSink : public PresentationSink {
 public:
  struct Options {
    std::string app_name = "TaskNag";
    std::string notifier = "notify-send";
    std::string sound_command = "canberra-gtk-play";
    std::vector<std::string> sound_args = {"-i", "message-new-instant"};
    std::string focus_command;
    std::vector<std::string> focus_args;
  };

  explicit DesktopPresentationSink(Options options);

  Result<void> showAlert(const std::string& title, const std::string& body) override;
  Result<void> playCue() override;
  Result<void> bringToFront() override;

 private:
  Options options_;
};

// Writes alerts to a stream, for headless use and the CLI --console flag
class ConsolePresentationSink : public PresentationSink {
 public:
  explicit ConsolePresentationSink(std::ostream& out);

  Result<void> showAlert(const std::string& title, const std::string& body) override;
  Result<void> playCue() override;
  Result<void> bringToFront() override;

 private:
  std::ostream& out_;
};

}  // namespace tasknag::notify
