#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_set>

#include "core/frame.hpp"

/*
    CaptureCycleBatcher gives every frame captured "together" across displays one canonical timestamp.

    One cycle is open at a time. An arriving frame closes it and opens a new one when its display
    already contributed to the open cycle, or when the cycle is older than the batching window.
    Otherwise it joins the open cycle and takes its timestamp. A new cycle is anchored at the wall
    time its first frame arrived at the orchestrator, not at that frame's capture time; the window
    is measured on the steady arrival time. Only the timestamp changes; frame order is never touched.
*/

namespace rwc {

struct CaptureCycle {
  WallTime canonical_timestamp{};
  SteadyTime started_at{};
  std::unordered_set<std::uint32_t> displays;
};

class CaptureCycleBatcher {
public:
  explicit CaptureCycleBatcher(std::chrono::milliseconds window);

  // Returns the canonical timestamp for a frame that arrived at (arrival, arrival_wall)
  WallTime assign(std::uint32_t display_id, SteadyTime arrival, WallTime arrival_wall);

  // Display unplugged: an open cycle it belongs to is closed
  void remove_display(std::uint32_t display_id);

  void reset();

  void set_window(std::chrono::milliseconds window) { window_ = window; }
  std::chrono::milliseconds window() const { return window_; }

  const std::optional<CaptureCycle>& open_cycle() const { return open_; }

  // Cycles opened since construction or the last reset
  std::uint64_t cycles_opened() const { return cycles_opened_; }

private:
  std::chrono::milliseconds window_;
  std::optional<CaptureCycle> open_;
  std::uint64_t cycles_opened_{0};
};

} // namespace rwc
