#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rwc {

enum class DropPolicy {
  DropOldest,
  DropNewest
};

struct Resolution {
  int width = 3840;
  int height = 2160;
};

// Capture policy handed to the orchestrator at start and swappable at runtime
struct CaptureConfig {
  int interval_ms = 2000;

  bool deduplication_enabled = true;
  double deduplication_threshold = 0.9985; // frames at or above this similarity are discarded

  Resolution max_resolution{};

  std::vector<std::string> excluded_apps;  // bundle identifiers
  bool exclude_private_windows = true;
  std::vector<std::string> custom_private_window_patterns;

  bool capture_on_window_change = true;
  bool record_all_displays = false;        // false = follow the focused display only
  bool capture_browser_url = true;
};

// Timing constants that were tuned by hand. Kept configurable rather than hardcoded
struct TuningConfig {
  int cycle_window_ms = 350;
  int metadata_cache_ttl_ms = 250;
  int window_change_debounce_ms = 200;

  int settle_delay_ms = 120;
  int settle_poll_ms = 40;
  int settle_timeout_ms = 450;

  int min_window_width = 80;
  int min_window_height = 80;
  double min_window_alpha = 0.05;
};

struct QueueConfig {
  std::size_t capacity = 16;
  DropPolicy drop_policy = DropPolicy::DropOldest;
};

struct BufferingConfig {
  QueueConfig raw_frames{};
  QueueConfig output_frames{64, DropPolicy::DropOldest};
};

struct LoggingConfig {
  std::string level = "info";
  std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
  std::string file_path = "";  // empty = console only
};

struct MetricsConfig {
  bool enable_console_log = true;
  int log_interval_ms = 5000;
};

struct ReplayDisplayConfig {
  std::uint32_t runtime_id = 1;
  std::string name = "";
  int x = 0;
  int y = 0;
  int width = 1920;
  int height = 1080;
  bool is_main = false;

  std::uint32_t vendor = 0;
  std::uint32_t model = 0;
  std::uint32_t serial = 0;

  std::string image_dir = ""; // empty = synthesize a static frame
};

struct ReplayAppConfig {
  std::string bundle_id = "";
  std::string app_name = "";
  std::string window_title = "";
  std::string browser_url = "";
};

// Collaborator implementation used by the daemon: displays declared here, frames read from disk
struct ReplayConfig {
  std::vector<ReplayDisplayConfig> displays;
  ReplayAppConfig frontmost{};
  bool has_capture_permission = true;
};

struct DaemonConfig {
  int max_runtime_s = 0;         // 0 = run until SIGINT
  std::string output_dir = "";   // empty = don't write kept frames
};

struct AppConfig {
  CaptureConfig capture{};
  TuningConfig tuning{};
  BufferingConfig buffering{};
  LoggingConfig logging{};
  MetricsConfig metrics{};
  ReplayConfig replay{};
  DaemonConfig daemon{};
};

} // namespace rwc
