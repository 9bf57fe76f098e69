#include <stdexcept>
#include <string>

#include "core/config_loader.hpp"
#include "test_support.hpp"

static bool ThrowsMentioning(const std::string& yaml, const std::string& needle) {
  try {
    rwc::LoadConfigFromYamlString(yaml);
  } catch (const std::runtime_error& e) {
    const bool found = std::string(e.what()).find(needle) != std::string::npos;
    if (!found) std::cerr << "  unexpected message: " << e.what() << "\n";
    return found;
  }
  return false;
}

static void EmptyDocumentGivesDefaults() {
  const rwc::AppConfig cfg = rwc::LoadConfigFromYamlString("{}");

  CHECK_EQ(cfg.capture.interval_ms, 2000);
  CHECK(cfg.capture.deduplication_enabled);
  CHECK(cfg.capture.deduplication_threshold == 0.9985);
  CHECK_EQ(cfg.capture.max_resolution.width, 3840);
  CHECK_EQ(cfg.capture.max_resolution.height, 2160);
  CHECK(cfg.capture.excluded_apps.empty());
  CHECK(cfg.capture.exclude_private_windows);
  CHECK(cfg.capture.capture_on_window_change);
  CHECK(!cfg.capture.record_all_displays);
  CHECK(cfg.capture.capture_browser_url);

  CHECK_EQ(cfg.tuning.cycle_window_ms, 350);
  CHECK_EQ(cfg.tuning.metadata_cache_ttl_ms, 250);
  CHECK_EQ(cfg.tuning.window_change_debounce_ms, 200);
  CHECK_EQ(cfg.logging.level, std::string("info"));
  CHECK(cfg.buffering.output_frames.drop_policy == rwc::DropPolicy::DropOldest);
}

static void FullDocumentIsRead() {
  const rwc::AppConfig cfg = rwc::LoadConfigFromYamlString(R"(
capture:
  interval_ms: 500
  deduplication_threshold: 0.98
  max_resolution: { width: 1920, height: 1080 }
  excluded_apps: [com.1password.1password, com.apple.keychainaccess]
  custom_private_window_patterns: [Confidential]
  record_all_displays: true
tuning:
  cycle_window_ms: 200
buffering:
  raw_frames: { capacity: 4, drop_policy: drop_newest }
logging:
  level: debug
replay:
  displays:
    - { name: left, width: 1280, height: 800, is_main: true }
    - { runtime_id: 9, name: right, x: 1280, width: 1920, height: 1080, serial: 77 }
  frontmost: { bundle_id: com.apple.Terminal, window_title: zsh }
daemon:
  max_runtime_s: 10
)");

  CHECK_EQ(cfg.capture.interval_ms, 500);
  CHECK(cfg.capture.deduplication_threshold == 0.98);
  CHECK_EQ(cfg.capture.max_resolution.width, 1920);
  CHECK_EQ(cfg.capture.excluded_apps.size(), std::size_t{2});
  CHECK_EQ(cfg.capture.excluded_apps[1], std::string("com.apple.keychainaccess"));
  CHECK_EQ(cfg.capture.custom_private_window_patterns.size(), std::size_t{1});
  CHECK(cfg.capture.record_all_displays);
  CHECK_EQ(cfg.tuning.cycle_window_ms, 200);
  CHECK_EQ(cfg.buffering.raw_frames.capacity, std::size_t{4});
  CHECK(cfg.buffering.raw_frames.drop_policy == rwc::DropPolicy::DropNewest);
  CHECK_EQ(cfg.logging.level, std::string("debug"));

  CHECK_EQ(cfg.replay.displays.size(), std::size_t{2});
  CHECK_EQ(cfg.replay.displays[0].runtime_id, 1u);
  CHECK(cfg.replay.displays[0].is_main);
  CHECK_EQ(cfg.replay.displays[1].runtime_id, 9u);
  CHECK_EQ(cfg.replay.displays[1].serial, 77u);
  CHECK_EQ(cfg.replay.frontmost.bundle_id, std::string("com.apple.Terminal"));
  CHECK_EQ(cfg.daemon.max_runtime_s, 10);
}

static void InvalidValuesNameTheKey() {
  CHECK(ThrowsMentioning("capture: { interval_ms: 0 }", "capture.interval_ms"));
  CHECK(ThrowsMentioning("capture: { interval_ms: fast }", "capture.interval_ms"));
  CHECK(ThrowsMentioning("capture: { deduplication_threshold: 1.5 }", "capture.deduplication_threshold"));
  CHECK(ThrowsMentioning("capture: { excluded_apps: com.example }", "capture.excluded_apps"));
  CHECK(ThrowsMentioning("buffering: { raw_frames: { drop_policy: drop_all } }", "buffering.raw_frames.drop_policy"));
  CHECK(ThrowsMentioning("logging: { level: loud }", "logging.level"));
  CHECK(ThrowsMentioning("tuning: { settle_poll_ms: 100, settle_timeout_ms: 50 }", "tuning.settle_timeout_ms"));
  CHECK(ThrowsMentioning("replay: { displays: [ { runtime_id: 3 }, { runtime_id: 3 } ] }", "replay.displays[1].runtime_id"));
  CHECK(ThrowsMentioning("capture: [unterminated", "Failed to parse YAML"));
}

static void CaptureConfigValidation() {
  rwc::CaptureConfig cfg;
  rwc::ValidateCaptureConfig(cfg);

  cfg.deduplication_threshold = 1.0;
  rwc::ValidateCaptureConfig(cfg);

  cfg.deduplication_threshold = -0.1;
  CHECK_THROWS(rwc::ValidateCaptureConfig(cfg), std::runtime_error);

  cfg = rwc::CaptureConfig{};
  cfg.max_resolution.height = 0;
  CHECK_THROWS(rwc::ValidateCaptureConfig(cfg), std::runtime_error);
}

int main() {
  EmptyDocumentGivesDefaults();
  FullDocumentIsRead();
  InvalidValuesNameTheKey();
  CaptureConfigValidation();
  return rwc_test::Finish("config_loader");
}
