#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

/*
    Defines the structures that flow through the capture pipeline: the frame itself, the window/app
    context attached to it, and the display and window descriptions reported by the platform.
*/

namespace rwc {

using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

// Context attached to a frame. Every app field is optional; a default-constructed value is the
// "nothing resolved" state, not a sentinel
struct FrameMetadata {
  std::optional<std::string> app_bundle_id;
  std::optional<std::string> app_name;
  std::optional<std::string> window_title;
  std::optional<std::string> browser_url;

  // Stable, hardware-derived display id (0 = unknown)
  std::uint32_t display_id{0};

  // True when the frame comes from the display the user is looking at
  bool is_focused{false};

  bool has_app_identity() const { return app_bundle_id.has_value() || app_name.has_value(); }

  bool operator==(const FrameMetadata& o) const {
    return app_bundle_id == o.app_bundle_id && app_name == o.app_name &&
           window_title == o.window_title && browser_url == o.browser_url &&
           display_id == o.display_id && is_focused == o.is_focused;
  }
  bool operator!=(const FrameMetadata& o) const { return !(*this == o); }
};

struct CapturedFrame {
  // Wall-clock capture time. Rewritten to the cycle's canonical time in multi-display mode
  WallTime timestamp{};

  // Volatile OS handle of the display this frame came from
  std::uint32_t display_id{0};

  // Per-source sequence number (monotonic)
  std::uint64_t sequence_id{0};

  // Pixel data, BGRA unless the platform says otherwise. Width, height and row stride live in the Mat
  cv::Mat image;

  FrameMetadata metadata;

  int width() const { return image.cols; }
  int height() const { return image.rows; }
  std::size_t row_stride() const { return image.step[0]; }
  std::size_t byte_size() const { return image.empty() ? 0 : row_stride() * static_cast<std::size_t>(image.rows); }
};

struct DisplayInfo {
  std::uint32_t runtime_id{0};
  std::uint32_t stable_id{0};
  cv::Rect bounds{};           // global pixel coordinates
  std::string name;
  bool is_main{false};
};

// What the platform knows about a monitor's hardware. Zeros mean "not reported"
struct DisplayHardwareInfo {
  std::uint32_t vendor{0};
  std::uint32_t model{0};
  std::uint32_t serial{0};
  int pixel_width{0};
  int pixel_height{0};
};

// One on-screen window, as listed front to back by the platform
struct WindowSnapshot {
  std::uint32_t window_id{0};
  int owner_pid{0};
  std::string owner_name;
  std::string title;
  cv::Rect bounds{};
  double alpha{1.0};
  int layer{0};                // 0 = normal application window
};

struct AppIdentity {
  std::optional<std::string> bundle_id;
  std::optional<std::string> name;
};

struct CaptureStatistics {
  std::uint64_t total_frames_captured{0};
  std::uint64_t frames_deduped{0};
  std::uint64_t frames_excluded{0};
  std::uint64_t capture_failures{0};
  std::uint64_t average_frame_size_bytes{0};
  std::optional<WallTime> capture_start_time;
  std::optional<WallTime> last_frame_time;

  std::uint64_t frames_forwarded() const {
    return total_frames_captured - frames_deduped - frames_excluded;
  }

  // Share of decided frames that were dropped as duplicates
  double deduplication_rate() const {
    const std::uint64_t decided = frames_forwarded() + frames_deduped;
    if (decided == 0) return 0.0;
    return static_cast<double>(frames_deduped) / static_cast<double>(decided);
  }
};

} // namespace rwc
