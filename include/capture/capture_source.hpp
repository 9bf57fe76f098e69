#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "core/config.hpp"
#include "core/frame.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/metrics.hpp"
#include "infra/repeating_timer.hpp"
#include "platform/platform.hpp"

namespace rwc {

// One polling unit bound to a single display. Idle -> Active -> Idle.
// Every tick rasterizes the display and pushes a raw, unenriched frame into the shared channel.
// It never reads orchestrator state; the channel is its only output.
class CaptureSource {
public:
  CaptureSource(std::shared_ptr<ScreenRasterizer> rasterizer, SourceMetrics* metrics);
  ~CaptureSource();

  CaptureSource(const CaptureSource&) = delete;
  CaptureSource& operator=(const CaptureSource&) = delete;

  // No-op if already active. The first capture happens immediately
  void start(const CaptureConfig& cfg, std::uint32_t display_id, std::shared_ptr<BoundedQueue<CapturedFrame>> out);

  // Idempotent
  void stop();

  // Capture now and restart the interval from zero
  void capture_immediate_and_reset_timer();

  // Applies from the next tick
  void update_config(const CaptureConfig& cfg);

  bool is_active() const;
  std::uint32_t display_id() const;

private:
  void tick(bool immediate);

  std::shared_ptr<ScreenRasterizer> rasterizer_;
  SourceMetrics* metrics_;
  RepeatingTimer timer_;

  mutable std::mutex mu_;
  CaptureConfig cfg_;
  std::uint32_t display_id_{0};
  std::shared_ptr<BoundedQueue<CapturedFrame>> out_;
  bool active_{false};
  std::uint64_t next_id_{0}; // Simple ID used to count each frame as it comes in
};

// Downscale to fit max_resolution, aspect preserved. Returns the input untouched when it already fits
cv::Mat FitToResolution(const cv::Mat& image, const Resolution& max_resolution);

} // namespace rwc
