#include "capture/capture_source.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace rwc {

cv::Mat FitToResolution(const cv::Mat& image, const Resolution& max_resolution) {
  if (image.cols <= max_resolution.width && image.rows <= max_resolution.height) return image;

  const double scale = std::min(static_cast<double>(max_resolution.width) / image.cols,
                                static_cast<double>(max_resolution.height) / image.rows);
  const int w = std::clamp(static_cast<int>(std::lround(image.cols * scale)), 1, max_resolution.width);
  const int h = std::clamp(static_cast<int>(std::lround(image.rows * scale)), 1, max_resolution.height);

  cv::Mat out;
  cv::resize(image, out, cv::Size(w, h), 0, 0, cv::INTER_AREA);
  return out;
}

CaptureSource::CaptureSource(std::shared_ptr<ScreenRasterizer> rasterizer, SourceMetrics* metrics)
    : rasterizer_(std::move(rasterizer)), metrics_(metrics), timer_("capture_source") {}

CaptureSource::~CaptureSource() {
  stop();
}

void CaptureSource::start(const CaptureConfig& cfg, std::uint32_t display_id, std::shared_ptr<BoundedQueue<CapturedFrame>> out) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (active_) return;
    cfg_ = cfg;
    display_id_ = display_id;
    out_ = std::move(out);
    active_ = true;
  }

  spdlog::info("[capture_source] display {} started, interval {} ms", display_id, cfg.interval_ms);
  timer_.start(std::chrono::milliseconds(cfg.interval_ms), [this](bool immediate) { tick(immediate); }, true);
}

void CaptureSource::stop() {
  std::uint32_t display_id = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!active_) return;
    active_ = false;
    display_id = display_id_;
  }

  // Outside the lock: an in-flight tick may still need mu_ to finish
  timer_.stop();

  {
    std::lock_guard<std::mutex> lock(mu_);
    out_.reset();
  }
  spdlog::info("[capture_source] display {} stopped", display_id);
}

void CaptureSource::capture_immediate_and_reset_timer() {
  if (!is_active()) return;
  if (metrics_) metrics_->on_immediate();
  timer_.fire_now();
}

void CaptureSource::update_config(const CaptureConfig& cfg) {
  bool interval_changed = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    interval_changed = cfg.interval_ms != cfg_.interval_ms;
    cfg_ = cfg;
  }
  if (interval_changed) timer_.set_interval(std::chrono::milliseconds(cfg.interval_ms));
}

bool CaptureSource::is_active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_;
}

std::uint32_t CaptureSource::display_id() const {
  std::lock_guard<std::mutex> lock(mu_);
  return display_id_;
}

void CaptureSource::tick(bool immediate) {
  CaptureConfig cfg;
  std::uint32_t display_id = 0;
  std::shared_ptr<BoundedQueue<CapturedFrame>> out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!active_) return;
    cfg = cfg_;
    display_id = display_id_;
    out = out_;
  }

  const auto t0 = std::chrono::steady_clock::now();

  // A failed tick is logged and skipped, the timer keeps running
  cv::Mat img;
  try {
    img = rasterizer_->capture_display(display_id);
  } catch (const CaptureFailure& e) {
    if (metrics_) metrics_->on_failure();
    spdlog::warn("[capture_source] display {} capture failed: {}", display_id, e.what());
    return;
  } catch (const std::exception& e) {
    if (metrics_) metrics_->on_failure();
    spdlog::error("[capture_source] display {} rasterizer error: {}", display_id, e.what());
    return;
  }

  if (img.empty()) {
    if (metrics_) metrics_->on_failure();
    spdlog::warn("[capture_source] display {} returned an empty image", display_id);
    return;
  }

  CapturedFrame f;
  f.timestamp = WallClock::now();
  f.display_id = display_id;
  f.image = FitToResolution(img, cfg.max_resolution);
  {
    std::lock_guard<std::mutex> lock(mu_);
    f.sequence_id = next_id_++;
  }

  const auto capture_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count();
  if (metrics_) metrics_->on_frame(static_cast<std::uint64_t>(capture_ns));

  spdlog::trace("[capture_source] display {} frame {} {}x{}{}", display_id, f.sequence_id, f.width(), f.height(), immediate ? " (immediate)" : "");

  if (out && !out->try_push(std::move(f))) {
    spdlog::debug("[capture_source] display {} frame dropped by raw channel", display_id);
  }
}

} // namespace rwc
