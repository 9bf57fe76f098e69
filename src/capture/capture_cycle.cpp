#include "capture/capture_cycle.hpp"

namespace rwc {

CaptureCycleBatcher::CaptureCycleBatcher(std::chrono::milliseconds window) : window_(window) {}

WallTime CaptureCycleBatcher::assign(std::uint32_t display_id, SteadyTime arrival, WallTime arrival_wall) {
  const bool expired = open_ && (arrival - open_->started_at) > window_;
  const bool repeated = open_ && open_->displays.count(display_id) > 0;

  if (!open_ || expired || repeated) {
    CaptureCycle cycle;
    cycle.canonical_timestamp = arrival_wall;
    cycle.started_at = arrival;
    open_ = std::move(cycle);
    ++cycles_opened_;
  }

  open_->displays.insert(display_id);
  return open_->canonical_timestamp;
}

void CaptureCycleBatcher::remove_display(std::uint32_t display_id) {
  if (open_ && open_->displays.count(display_id) > 0) open_.reset();
}

void CaptureCycleBatcher::reset() {
  open_.reset();
  cycles_opened_ = 0;
}

} // namespace rwc
