#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "capture/capture_cycle.hpp"
#include "capture/capture_source.hpp"
#include "capture/window_change_gate.hpp"
#include "capture/window_metadata_resolver.hpp"
#include "core/config.hpp"
#include "core/frame.hpp"
#include "core/frame_deduplicator.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/metrics.hpp"
#include "infra/serial_executor.hpp"
#include "infra/thread_runner.hpp"
#include "platform/platform.hpp"

/*
    CaptureOrchestrator owns the capture sources (one per display, or one following the focused
    display), merges their raw frames, stamps multi-display capture cycles with one timestamp,
    attaches window/app metadata, drops near-duplicates per display and publishes what survives on
    a single output stream.

    Threading: every piece of mutable state below the "executor-only" marker is touched exclusively
    by executor_. Public calls run there through run_sync, frame arrivals are handed over by the pump
    thread, and platform notifications are posted. Capture sources only write into the raw channel.

      sources (timer threads) -> raw channel -> pump -> executor: normalize, enrich, dedup -> output stream
*/

namespace rwc {

enum class CaptureState { Stopped, Starting, Capturing, Stopping };

const char* ToString(CaptureState state);

class CaptureOrchestrator {
public:
  CaptureOrchestrator(Platform platform, TuningConfig tuning = TuningConfig{}, BufferingConfig buffering = BufferingConfig{});
  ~CaptureOrchestrator();

  CaptureOrchestrator(const CaptureOrchestrator&) = delete;
  CaptureOrchestrator& operator=(const CaptureOrchestrator&) = delete;

  // Throws PermissionDeniedError without capture permission, std::logic_error if already capturing,
  // std::runtime_error for an invalid config or when no display can be enumerated. Nothing is left
  // running when it throws
  void start(const CaptureConfig& cfg);

  // Idempotent. Closes the output stream
  void stop();

  // Validates first. Switching between single- and multi-display mode restarts capture, publishing
  // into the same output stream
  void update_config(const CaptureConfig& cfg);
  CaptureConfig get_config() const;

  CaptureStatistics get_statistics() const;
  std::vector<SourceMetricsSnapshot> source_metrics() const;

  std::vector<DisplayInfo> get_available_displays() const;
  std::optional<DisplayInfo> get_focused_display() const;

  // Displays with a live capture source
  std::vector<std::uint32_t> active_display_ids() const;

  bool is_capturing() const { return state_.load() == CaptureState::Capturing; }
  CaptureState state() const { return state_.load(); }

  // Deduplicated frames of the current (or last) session. start() after stop() creates a new stream,
  // a mode-change restart keeps the old one
  std::shared_ptr<BoundedQueue<CapturedFrame>> frame_stream() const;

  // Fired at most once per session when accessibility access is denied
  void set_on_permission_warning(std::function<void()> cb);

  // Fired after the platform stopped capture on its own and state was cleaned up
  void set_on_capture_stopped(std::function<void()> cb);

private:
  void do_start(const CaptureConfig& cfg);
  // keep_stream leaves the output stream open so a following do_start publishes into it
  void do_stop(bool keep_stream = false);
  void teardown(bool keep_stream = false);

  // Refreshes displays_ as a side effect
  std::vector<DisplayInfo> enumerate_displays() const;
  std::uint32_t stable_id_for(std::uint32_t runtime_id) const;
  std::uint32_t resolve_active_display() const;

  void start_source(std::uint32_t display_id);
  void stop_source(std::uint32_t display_id);

  void process_frame(CapturedFrame frame, SteadyTime arrival, WallTime arrival_wall, std::uint64_t session);
  FrameMetadata enrich(const CapturedFrame& frame);
  FrameMetadata frontmost_metadata(bool include_browser_url) const;
  bool is_excluded(const FrameMetadata& md) const;
  void forward(const CapturedFrame& frame);

  void handle_topology_changed(std::uint64_t session);
  void handle_focused_display_changed(std::uint32_t display_id, std::uint64_t session);
  void handle_window_change(const FrameMetadata& info, std::uint64_t session);
  void handle_external_stop(std::uint64_t session);
  void handle_accessibility_denied(std::uint64_t session);

  bool is_current(std::uint64_t session) const;

  // Worker threads
  void pump_frames(const StopToken& stop, std::uint64_t session, std::shared_ptr<BoundedQueue<CapturedFrame>> raw);
  void settle_window_changes(const StopToken& stop, std::uint64_t session);
  void signal_window_change();

  Platform platform_;
  TuningConfig tuning_;
  BufferingConfig buffering_;

  std::atomic<CaptureState> state_{CaptureState::Stopped};

  mutable std::mutex stream_mu_;
  std::shared_ptr<BoundedQueue<CapturedFrame>> output_frames_;

  mutable std::mutex callbacks_mu_;
  std::function<void()> on_permission_warning_;
  std::function<void()> on_capture_stopped_;

  // Window-change signalling between the platform thread and the settle worker
  std::mutex settle_mu_;
  std::condition_variable settle_cv_;
  bool settle_pending_{false};
  bool settle_stopping_{false};

  ThreadRunner pump_{"frame_pump"};
  ThreadRunner settle_{"window_settle"};

  // executor-only
  CaptureConfig config_{};
  std::uint64_t session_{0};
  std::map<std::uint32_t, std::unique_ptr<CaptureSource>> sources_;
  mutable std::unordered_map<std::uint32_t, DisplayInfo> displays_;  // last enumeration, by runtime id
  std::shared_ptr<BoundedQueue<CapturedFrame>> raw_frames_;
  std::optional<PlatformEvents::Subscription> subscription_;

  FrameDeduplicator dedup_;
  std::unordered_map<std::uint32_t, DedupReference> references_;  // multi-display: per display
  std::optional<DedupReference> single_reference_;                  // single-display: global

  CaptureCycleBatcher batcher_;
  WindowMetadataResolver resolver_;
  WindowChangeGate gate_;

  std::uint32_t focused_display_id_{0};
  bool switching_display_{false};
  bool permission_warning_shown_{false};

  CaptureStatistics stats_{};
  std::uint64_t total_bytes_{0};
  Metrics metrics_;

  // Last member: its thread must be gone before anything above is destroyed
  mutable SerialExecutor executor_{"capture_orchestrator"};
};

} // namespace rwc
