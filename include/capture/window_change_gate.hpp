#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "core/frame.hpp"

/*
    Decides whether a foreground window change deserves an immediate capture.

    Suppressed when the new title is "related" to the last tracked title of the same app (one contains
    the other once unread counters like "(3)" or "[12]" are stripped), and when the previous triggered
    capture was less than the debounce interval ago. Tracked identity and the debounce clock only move
    when a capture is triggered.
*/

namespace rwc {

class WindowChangeGate {
public:
  explicit WindowChangeGate(std::chrono::milliseconds debounce);

  bool should_capture(const std::optional<std::string>& app_id, const std::optional<std::string>& title, SteadyTime now);

  void reset();

  void set_debounce(std::chrono::milliseconds debounce) { debounce_ = debounce; }

  const std::optional<std::string>& tracked_app() const { return app_id_; }
  const std::optional<std::string>& tracked_title() const { return title_; }

  // Both non-empty and one contains the other after counter stripping
  static bool TitlesRelated(const std::string& a, const std::string& b);

  // "Inbox (3)" -> "Inbox"; removes bracketed all-digit groups and trims
  static std::string StripCounters(const std::string& title);

private:
  std::chrono::milliseconds debounce_;
  std::optional<std::string> app_id_;
  std::optional<std::string> title_;
  std::optional<SteadyTime> last_trigger_;
};

} // namespace rwc
