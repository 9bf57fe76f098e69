#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>

#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

#include "capture/capture_orchestrator.hpp"
#include "core/config_loader.hpp"
#include "core/errors.hpp"
#include "infra/logging.hpp"
#include "platform/replay_platform.hpp"

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

// capture_daemon runs the capture pipeline against the replay platform and drains its frame stream.
// Kept frames are optionally written out as PNG under <output_dir>/<display id>/

static void LogStatistics(const rwc::CaptureOrchestrator& orchestrator) {
  const rwc::CaptureStatistics s = orchestrator.get_statistics();
  spdlog::info("[stats] captured={} deduped={} excluded={} forwarded={} failures={} dedup_rate={:.1f}% avg_bytes={}",
               s.total_frames_captured, s.frames_deduped, s.frames_excluded, s.frames_forwarded(),
               s.capture_failures, s.deduplication_rate() * 100.0, s.average_frame_size_bytes);

  for (const auto& m : orchestrator.source_metrics()) {
    spdlog::debug("[stats] display {} ticks={} emitted={} failures={} immediate={} avg_capture={:.2f} ms",
                  m.display_id, m.ticks, m.frames_emitted, m.failures, m.immediate_captures, m.avg_capture_ns / 1e6);
  }
}

static void WriteFrame(const std::string& output_dir, const rwc::CapturedFrame& frame) {
  namespace fs = std::filesystem;

  const fs::path dir = fs::path(output_dir) / std::to_string(frame.metadata.display_id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    spdlog::warn("failed to create {}: {}", dir.string(), ec.message());
    return;
  }

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(frame.timestamp.time_since_epoch()).count();
  const fs::path file = dir / (std::to_string(ms) + "_" + std::to_string(frame.sequence_id) + ".png");
  try {
    if (!cv::imwrite(file.string(), frame.image)) spdlog::warn("failed to write {}", file.string());
  } catch (const cv::Exception& e) {
    spdlog::warn("failed to write {}: {}", file.string(), e.what());
  }
}

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    rwc::AppConfig cfg = rwc::LoadConfigFromYamlFile(cfg_path);
    rwc::InitLogging(cfg.logging);
    spdlog::info("Loaded config OK: {}", cfg_path);

    std::signal(SIGINT, HandleSigint);
    const auto start = std::chrono::steady_clock::now();
    const auto max_runtime = std::chrono::seconds(cfg.daemon.max_runtime_s);
    const auto stats_interval = std::chrono::milliseconds(cfg.metrics.log_interval_ms);
    auto last_stats = start;

    auto replay = std::make_shared<rwc::ReplayPlatform>(cfg.replay);
    rwc::CaptureOrchestrator orchestrator(rwc::ReplayPlatform::AsPlatform(replay), cfg.tuning, cfg.buffering);

    std::atomic_bool stopped_externally{false};
    orchestrator.set_on_capture_stopped([&] { stopped_externally.store(true); });
    orchestrator.set_on_permission_warning([] {
      spdlog::warn("Accessibility access is denied; window titles and URLs will be missing");
    });

    for (const auto& d : orchestrator.get_available_displays()) {
      spdlog::info("display {} '{}' {}x{} stable id {}{}", d.runtime_id, d.name, d.bounds.width, d.bounds.height,
                   d.stable_id, d.is_main ? " (main)" : "");
    }

    orchestrator.start(cfg.capture);
    auto frames = orchestrator.frame_stream();

    // Run until SIGINT, the time limit, or the platform stopping capture on its own
    while (true) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        spdlog::info("Shutting down capture...");
        break;
      }

      const auto now = std::chrono::steady_clock::now();
      if (cfg.daemon.max_runtime_s > 0 && now - start >= max_runtime) {
        spdlog::info("Capture time limit reached. Shutting down capture...");
        break;
      }

      if (stopped_externally.load()) {
        spdlog::warn("Capture was stopped by the system. Exiting.");
        break;
      }

      rwc::CapturedFrame frame;
      if (frames->pop_for(frame, std::chrono::milliseconds(100)) == rwc::PopStatus::Item) {
        spdlog::info("frame display={} seq={} {}x{} app={} title='{}'{}", frame.metadata.display_id, frame.sequence_id,
                     frame.width(), frame.height(), frame.metadata.app_bundle_id.value_or("-"),
                     frame.metadata.window_title.value_or(""), frame.metadata.is_focused ? " [focused]" : "");
        if (!cfg.daemon.output_dir.empty()) WriteFrame(cfg.daemon.output_dir, frame);
      }

      if (cfg.metrics.enable_console_log && now - last_stats >= stats_interval) {
        LogStatistics(orchestrator);
        last_stats = now;
      }
    }

    orchestrator.stop();
    LogStatistics(orchestrator);

  } catch (const rwc::PermissionDeniedError& e) {
    spdlog::error("{}. Grant screen recording access and try again.", e.what());
    return 2;
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
