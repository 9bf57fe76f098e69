#include "capture/capture_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <set>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/config_loader.hpp"
#include "core/display_identity.hpp"
#include "core/errors.hpp"
#include "core/private_window.hpp"

namespace rwc {

using std::chrono::milliseconds;

const char* ToString(CaptureState state) {
  switch (state) {
    case CaptureState::Stopped: return "stopped";
    case CaptureState::Starting: return "starting";
    case CaptureState::Capturing: return "capturing";
    case CaptureState::Stopping: return "stopping";
  }
  return "unknown";
}

CaptureOrchestrator::CaptureOrchestrator(Platform platform, TuningConfig tuning, BufferingConfig buffering)
    : platform_(std::move(platform)),
      tuning_(tuning),
      buffering_(buffering),
      batcher_(milliseconds(tuning.cycle_window_ms)),
      resolver_(platform_.displays, platform_.windows, tuning),
      gate_(milliseconds(tuning.window_change_debounce_ms)) {
  if (!platform_.rasterizer || !platform_.displays || !platform_.windows || !platform_.apps || !platform_.permissions) {
    throw std::invalid_argument("CaptureOrchestrator: platform is missing a required collaborator");
  }
  executor_.start();
}

CaptureOrchestrator::~CaptureOrchestrator() {
  try {
    stop();
  } catch (const std::exception& e) {
    spdlog::error("[orchestrator] stop during destruction failed: {}", e.what());
  }
  executor_.shutdown();
}

// Public API, each call hops onto the executor

void CaptureOrchestrator::start(const CaptureConfig& cfg) {
  executor_.run_sync([this, cfg] { do_start(cfg); });
}

void CaptureOrchestrator::stop() {
  executor_.run_sync([this] { do_stop(); });
}

void CaptureOrchestrator::update_config(const CaptureConfig& cfg) {
  executor_.run_sync([this, cfg] {
    ValidateCaptureConfig(cfg);

    if (state_.load() != CaptureState::Capturing) {
      config_ = cfg;
      return;
    }

    // Sources are bound differently in the two modes, so a mode change is a full restart.
    // Consumers keep reading the same stream across it
    if (cfg.record_all_displays != config_.record_all_displays) {
      spdlog::info("[orchestrator] record_all_displays -> {}, restarting capture", cfg.record_all_displays);
      do_stop(true);
      do_start(cfg);
      return;
    }

    config_ = cfg;
    for (auto& kv : sources_) kv.second->update_config(cfg);
    spdlog::debug("[orchestrator] config updated for {} sources", sources_.size());
  });
}

CaptureConfig CaptureOrchestrator::get_config() const {
  return executor_.run_sync([this] { return config_; });
}

CaptureStatistics CaptureOrchestrator::get_statistics() const {
  return executor_.run_sync([this] {
    CaptureStatistics s = stats_;
    s.capture_failures = metrics_.failures_total();
    return s;
  });
}

std::vector<SourceMetricsSnapshot> CaptureOrchestrator::source_metrics() const {
  return executor_.run_sync([this] { return metrics_.snapshot(); });
}

std::vector<DisplayInfo> CaptureOrchestrator::get_available_displays() const {
  return executor_.run_sync([this] { return enumerate_displays(); });
}

std::optional<DisplayInfo> CaptureOrchestrator::get_focused_display() const {
  return executor_.run_sync([this]() -> std::optional<DisplayInfo> {
    const auto displays = enumerate_displays();
    const std::uint32_t active = resolve_active_display();
    for (const auto& d : displays) {
      if (d.runtime_id == active) return d;
    }
    return std::nullopt;
  });
}

std::vector<std::uint32_t> CaptureOrchestrator::active_display_ids() const {
  return executor_.run_sync([this] {
    std::vector<std::uint32_t> ids;
    for (const auto& kv : sources_) ids.push_back(kv.first);
    return ids;
  });
}

std::shared_ptr<BoundedQueue<CapturedFrame>> CaptureOrchestrator::frame_stream() const {
  std::lock_guard<std::mutex> lock(stream_mu_);
  return output_frames_;
}

void CaptureOrchestrator::set_on_permission_warning(std::function<void()> cb) {
  std::lock_guard<std::mutex> lock(callbacks_mu_);
  on_permission_warning_ = std::move(cb);
}

void CaptureOrchestrator::set_on_capture_stopped(std::function<void()> cb) {
  std::lock_guard<std::mutex> lock(callbacks_mu_);
  on_capture_stopped_ = std::move(cb);
}

// Lifecycle

void CaptureOrchestrator::do_start(const CaptureConfig& cfg) {
  if (state_.load() == CaptureState::Capturing) {
    throw std::logic_error("capture is already running");
  }
  ValidateCaptureConfig(cfg);

  state_.store(CaptureState::Starting);
  try {
    bool permitted = false;
    try {
      permitted = platform_.permissions->has_capture_permission();
    } catch (const std::exception& e) {
      spdlog::error("[orchestrator] permission check failed: {}", e.what());
    }
    if (!permitted) throw PermissionDeniedError("screen capture permission is not granted");

    const std::uint64_t session = ++session_;
    config_ = cfg;

    metrics_.clear();
    stats_ = CaptureStatistics{};
    stats_.capture_start_time = WallClock::now();
    total_bytes_ = 0;

    references_.clear();
    single_reference_.reset();
    batcher_.reset();
    resolver_.invalidate();
    gate_.reset();
    permission_warning_shown_ = false;
    switching_display_ = false;

    raw_frames_ = std::make_shared<BoundedQueue<CapturedFrame>>(buffering_.raw_frames.capacity, buffering_.raw_frames.drop_policy);
    {
      std::lock_guard<std::mutex> lock(stream_mu_);
      // Still open only when restarting in place
      if (!output_frames_ || output_frames_->closed()) {
        output_frames_ = std::make_shared<BoundedQueue<CapturedFrame>>(buffering_.output_frames.capacity, buffering_.output_frames.drop_policy);
      }
    }

    const auto displays = enumerate_displays();
    if (displays.empty()) throw std::runtime_error("no displays available to capture");

    focused_display_id_ = resolve_active_display();

    if (cfg.record_all_displays) {
      for (const auto& d : displays) start_source(d.runtime_id);
    } else {
      start_source(focused_display_id_);
    }

    // Consumers first, then the notifications that feed them
    pump_.start([this, session, raw = raw_frames_](const StopToken& stop) { pump_frames(stop, session, raw); });

    {
      std::lock_guard<std::mutex> lock(settle_mu_);
      settle_pending_ = false;
      settle_stopping_ = false;
    }
    settle_.start([this, session](const StopToken& stop) { settle_window_changes(stop, session); });

    if (platform_.events) {
      PlatformEventHandlers handlers;
      handlers.on_display_topology_changed = [this, session] {
        executor_.post([this, session] { handle_topology_changed(session); });
      };
      handlers.on_focused_display_changed = [this, session](std::uint32_t id) {
        executor_.post([this, session, id] { handle_focused_display_changed(id, session); });
      };
      handlers.on_active_window_changed = [this] { signal_window_change(); };
      handlers.on_capture_stopped_externally = [this, session] {
        executor_.post([this, session] { handle_external_stop(session); });
      };
      handlers.on_accessibility_denied = [this, session] {
        executor_.post([this, session] { handle_accessibility_denied(session); });
      };
      subscription_ = platform_.events->subscribe(std::move(handlers));
    }

    state_.store(CaptureState::Capturing);
    spdlog::info("[orchestrator] capturing {} display(s), mode={}, interval={} ms, dedup={} ({})",
                 sources_.size(), cfg.record_all_displays ? "all" : "focused", cfg.interval_ms,
                 cfg.deduplication_enabled ? "on" : "off", cfg.deduplication_threshold);
  } catch (const std::exception& e) {
    spdlog::error("[orchestrator] start failed: {}", e.what());
    teardown();
    state_.store(CaptureState::Stopped);
    throw;
  }
}

void CaptureOrchestrator::do_stop(bool keep_stream) {
  if (state_.load() == CaptureState::Stopped) return;

  state_.store(CaptureState::Stopping);
  teardown(keep_stream);
  state_.store(CaptureState::Stopped);

  spdlog::info("[orchestrator] stopped: {} frames seen, {} deduped, {} excluded",
               stats_.total_frames_captured, stats_.frames_deduped, stats_.frames_excluded);
}

void CaptureOrchestrator::teardown(bool keep_stream) {
  if (subscription_ && platform_.events) {
    try {
      platform_.events->unsubscribe(*subscription_);
    } catch (const std::exception& e) {
      spdlog::warn("[orchestrator] unsubscribe failed: {}", e.what());
    }
  }
  subscription_.reset();

  {
    std::lock_guard<std::mutex> lock(settle_mu_);
    settle_stopping_ = true;
  }
  settle_cv_.notify_all();
  settle_.stop();

  for (auto& kv : sources_) kv.second->stop();
  sources_.clear();

  if (raw_frames_) raw_frames_->close();
  pump_.stop();
  raw_frames_.reset();

  if (!keep_stream) {
    std::lock_guard<std::mutex> lock(stream_mu_);
    if (output_frames_) output_frames_->close();
  }

  references_.clear();
  single_reference_.reset();
  batcher_.reset();
  resolver_.invalidate();
  gate_.reset();
  switching_display_ = false;
  permission_warning_shown_ = false;

  // Anything still queued for the old session is discarded on arrival
  ++session_;
}

// Displays and sources

std::vector<DisplayInfo> CaptureOrchestrator::enumerate_displays() const {
  std::vector<DisplayInfo> displays = platform_.displays->list_displays();

  std::unordered_map<std::uint32_t, DisplayInfo> by_id;
  for (auto& d : displays) {
    if (d.stable_id == 0) {
      DisplayHardwareInfo hw;
      try {
        hw = platform_.displays->hardware_info(d.runtime_id);
      } catch (const std::exception& e) {
        spdlog::debug("[orchestrator] no hardware identity for display {}: {}", d.runtime_id, e.what());
      }
      if (IsSessionScopedIdentity(hw)) {
        spdlog::debug("[orchestrator] display {} has no hardware identity, id is session scoped", d.runtime_id);
      }
      d.stable_id = StableDisplayId(hw, d.runtime_id);
    }
    by_id[d.runtime_id] = d;
  }

  displays_ = std::move(by_id);
  return displays;
}

std::uint32_t CaptureOrchestrator::stable_id_for(std::uint32_t runtime_id) const {
  const auto it = displays_.find(runtime_id);
  if (it != displays_.end()) return it->second.stable_id;

  DisplayHardwareInfo hw;
  try {
    hw = platform_.displays->hardware_info(runtime_id);
  } catch (const std::exception& e) {
    spdlog::debug("[orchestrator] no hardware identity for display {}: {}", runtime_id, e.what());
  }
  return StableDisplayId(hw, runtime_id);
}

// Active display per the platform, or the main/first known display if that one isn't connected
std::uint32_t CaptureOrchestrator::resolve_active_display() const {
  std::uint32_t active = 0;
  try {
    active = platform_.displays->active_display_id();
  } catch (const std::exception& e) {
    spdlog::warn("[orchestrator] active display query failed: {}", e.what());
  }
  if (displays_.count(active) > 0) return active;

  std::uint32_t fallback = 0;
  for (const auto& kv : displays_) {
    if (kv.second.is_main) return kv.first;
    if (fallback == 0 || kv.first < fallback) fallback = kv.first;
  }
  return fallback != 0 ? fallback : active;
}

void CaptureOrchestrator::start_source(std::uint32_t display_id) {
  if (sources_.count(display_id) > 0) return;

  auto source = std::make_unique<CaptureSource>(platform_.rasterizer, metrics_.make_source(display_id));
  source->start(config_, display_id, raw_frames_);
  sources_.emplace(display_id, std::move(source));
}

void CaptureOrchestrator::stop_source(std::uint32_t display_id) {
  const auto it = sources_.find(display_id);
  if (it == sources_.end()) return;
  it->second->stop();
  sources_.erase(it);
}

bool CaptureOrchestrator::is_current(std::uint64_t session) const {
  return session == session_ && state_.load() == CaptureState::Capturing;
}

// Per-frame pipeline

void CaptureOrchestrator::process_frame(CapturedFrame frame, SteadyTime arrival, WallTime arrival_wall, std::uint64_t session) {
  // In-flight frame from a stopped or restarted session
  if (!is_current(session)) return;

  ++stats_.total_frames_captured;
  total_bytes_ += frame.byte_size();
  stats_.average_frame_size_bytes = total_bytes_ / stats_.total_frames_captured;

  // 1. One timestamp per multi-display capture cycle
  if (config_.record_all_displays) {
    frame.timestamp = batcher_.assign(frame.display_id, arrival, arrival_wall);
  }

  // 2. Window/app context
  frame.metadata = enrich(frame);

  if (is_excluded(frame.metadata)) {
    ++stats_.frames_excluded;
    spdlog::trace("[orchestrator] display {} frame {} excluded ({})", frame.display_id, frame.sequence_id,
                  frame.metadata.app_bundle_id.value_or("private window"));
    return;
  }

  // 3. Deduplication against this display's last kept frame
  if (!config_.deduplication_enabled) {
    forward(frame);
    return;
  }

  const DedupReference* reference = nullptr;
  if (config_.record_all_displays) {
    const auto it = references_.find(frame.display_id);
    if (it != references_.end()) reference = &it->second;
  } else if (single_reference_) {
    reference = &*single_reference_;
  }

  // Only the incoming frame is hashed, the reference keeps the hash it was stored with
  std::optional<DedupReference> candidate;
  bool keep = true;
  try {
    candidate = dedup_.make_reference(frame);
    keep = dedup_.should_keep(*candidate, reference, config_.deduplication_threshold);
  } catch (const std::exception& e) {
    spdlog::warn("[orchestrator] dedup failed for display {}, keeping frame: {}", frame.display_id, e.what());
  }

  if (!keep) {
    ++stats_.frames_deduped;
    spdlog::trace("[orchestrator] display {} frame {} deduplicated", frame.display_id, frame.sequence_id);
    return;
  }

  // A frame that could not be hashed is forwarded but does not replace the reference
  if (candidate) {
    if (config_.record_all_displays) {
      references_[frame.display_id] = *candidate;
    } else {
      single_reference_ = *candidate;
    }
  }
  forward(frame);
}

void CaptureOrchestrator::forward(const CapturedFrame& frame) {
  stats_.last_frame_time = frame.timestamp;

  std::shared_ptr<BoundedQueue<CapturedFrame>> out;
  {
    std::lock_guard<std::mutex> lock(stream_mu_);
    out = output_frames_;
  }
  if (out && !out->try_push(frame)) {
    spdlog::warn("[orchestrator] output stream full, frame from display {} dropped", frame.display_id);
  }
}

FrameMetadata CaptureOrchestrator::frontmost_metadata(bool include_browser_url) const {
  try {
    return platform_.apps->frontmost_app_info(include_browser_url);
  } catch (const std::exception& e) {
    spdlog::warn("[orchestrator] frontmost app query failed: {}", e.what());
    return FrameMetadata{};
  }
}

FrameMetadata CaptureOrchestrator::enrich(const CapturedFrame& frame) {
  const std::uint32_t stable_id = stable_id_for(frame.display_id);

  // Single display: the captured display is by definition the focused one
  if (!config_.record_all_displays) {
    FrameMetadata md = frontmost_metadata(config_.capture_browser_url);
    md.is_focused = true;
    md.display_id = stable_id;
    return md;
  }

  const bool focused = frame.display_id == focused_display_id_;
  const DisplayMetadataMap top = resolver_.top_window_per_display();

  FrameMetadata md;
  const auto it = top.find(frame.display_id);
  if (it != top.end()) {
    md = it->second;
    md.is_focused = focused;
  } else if (focused) {
    // Empty desktop on the focused display: the frontmost app still owns the user's attention
    md = frontmost_metadata(config_.capture_browser_url);
    md.is_focused = true;
  } else {
    md.is_focused = false;
  }

  md.display_id = stable_id;
  return md;
}

bool CaptureOrchestrator::is_excluded(const FrameMetadata& md) const {
  if (md.app_bundle_id) {
    const auto& excluded = config_.excluded_apps;
    if (std::find(excluded.begin(), excluded.end(), *md.app_bundle_id) != excluded.end()) return true;
  }
  if (config_.exclude_private_windows && md.window_title &&
      LooksLikePrivateWindow(*md.window_title, config_.custom_private_window_patterns)) {
    return true;
  }
  return false;
}

// Notifications

void CaptureOrchestrator::handle_topology_changed(std::uint64_t session) {
  if (!is_current(session)) return;

  resolver_.invalidate();

  std::vector<DisplayInfo> displays;
  try {
    displays = enumerate_displays();
  } catch (const std::exception& e) {
    spdlog::error("[orchestrator] display enumeration after topology change failed: {}", e.what());
    return;
  }

  if (!config_.record_all_displays) {
    // The followed display was unplugged: move to whatever is active now
    if (displays_.count(focused_display_id_) == 0) {
      handle_focused_display_changed(resolve_active_display(), session);
    }
    return;
  }

  std::set<std::uint32_t> present;
  for (const auto& d : displays) present.insert(d.runtime_id);

  for (const std::uint32_t id : present) {
    if (sources_.count(id) > 0) continue;
    try {
      start_source(id);
      spdlog::info("[orchestrator] display {} connected, capture started", id);
    } catch (const std::exception& e) {
      spdlog::error("[orchestrator] failed to start capture for display {}: {}", id, e.what());
    }
  }

  std::vector<std::uint32_t> gone;
  for (const auto& kv : sources_) {
    if (present.count(kv.first) == 0) gone.push_back(kv.first);
  }
  for (const std::uint32_t id : gone) {
    try {
      stop_source(id);
      spdlog::info("[orchestrator] display {} disconnected, capture stopped", id);
    } catch (const std::exception& e) {
      spdlog::error("[orchestrator] failed to stop capture for display {}: {}", id, e.what());
      sources_.erase(id);
    }
    references_.erase(id);
    batcher_.remove_display(id);
  }

  if (present.count(focused_display_id_) == 0) focused_display_id_ = resolve_active_display();
}

void CaptureOrchestrator::handle_focused_display_changed(std::uint32_t display_id, std::uint64_t session) {
  if (!is_current(session)) return;

  // Multi-display: only the isFocused flag moves
  if (config_.record_all_displays) {
    if (focused_display_id_ != display_id) {
      spdlog::debug("[orchestrator] focused display {} -> {}", focused_display_id_, display_id);
    }
    focused_display_id_ = display_id;
    return;
  }

  if (display_id == focused_display_id_ && sources_.count(display_id) > 0) return;

  if (switching_display_) {
    spdlog::debug("[orchestrator] display switch already in progress, ignoring switch to {}", display_id);
    return;
  }
  switching_display_ = true;

  const std::uint32_t previous = focused_display_id_;
  try {
    if (displays_.count(display_id) == 0) enumerate_displays();

    std::vector<std::uint32_t> current;
    for (const auto& kv : sources_) current.push_back(kv.first);
    for (const std::uint32_t id : current) stop_source(id);

    // Same raw channel, so the pump and the frame stream carry on uninterrupted
    start_source(display_id);
    focused_display_id_ = display_id;
    spdlog::info("[orchestrator] switched capture from display {} to {}", previous, display_id);
  } catch (const std::exception& e) {
    spdlog::error("[orchestrator] failed to switch capture to display {}: {}", display_id, e.what());
  }

  switching_display_ = false;
}

void CaptureOrchestrator::handle_window_change(const FrameMetadata& info, std::uint64_t session) {
  if (!is_current(session)) return;
  if (!config_.capture_on_window_change) return;

  const auto& app = info.app_bundle_id ? info.app_bundle_id : info.app_name;
  if (!gate_.should_capture(app, info.window_title, std::chrono::steady_clock::now())) {
    spdlog::trace("[orchestrator] window change suppressed ({})", info.window_title.value_or(""));
    return;
  }

  spdlog::debug("[orchestrator] window change to '{}' ({}), capturing now",
                info.window_title.value_or(""), app.value_or("unknown app"));

  // Each source only signals its own timer thread, so all displays capture concurrently
  for (auto& kv : sources_) kv.second->capture_immediate_and_reset_timer();
}

void CaptureOrchestrator::handle_external_stop(std::uint64_t session) {
  if (!is_current(session)) return;

  spdlog::warn("[orchestrator] capture was stopped outside of stop(), tearing down");
  state_.store(CaptureState::Stopping);
  teardown();
  state_.store(CaptureState::Stopped);

  std::function<void()> cb;
  {
    std::lock_guard<std::mutex> lock(callbacks_mu_);
    cb = on_capture_stopped_;
  }
  if (!cb) return;

  try {
    cb();
  } catch (const std::exception& e) {
    spdlog::error("[orchestrator] capture-stopped callback threw: {}", e.what());
  }
}

void CaptureOrchestrator::handle_accessibility_denied(std::uint64_t session) {
  if (!is_current(session)) return;
  if (permission_warning_shown_) return;
  permission_warning_shown_ = true;

  spdlog::warn("[orchestrator] accessibility permission denied, window context will be limited");

  std::function<void()> cb;
  {
    std::lock_guard<std::mutex> lock(callbacks_mu_);
    cb = on_permission_warning_;
  }
  if (!cb) return;

  try {
    cb();
  } catch (const std::exception& e) {
    spdlog::error("[orchestrator] permission-warning callback threw: {}", e.what());
  }
}

// Worker threads

void CaptureOrchestrator::pump_frames(const StopToken& stop, std::uint64_t session, std::shared_ptr<BoundedQueue<CapturedFrame>> raw) {
  using namespace std::chrono_literals;

  while (!stop.stop_requested()) {
    CapturedFrame f;
    const PopStatus st = raw->pop_for(f, 50ms);
    if (st == PopStatus::Closed) return;
    if (st == PopStatus::Timeout) continue;
    const SteadyTime arrival = std::chrono::steady_clock::now();
    const WallTime arrival_wall = WallClock::now();

    std::future<void> done;
    try {
      done = executor_.submit([this, f = std::move(f), arrival, arrival_wall, session]() mutable {
        process_frame(std::move(f), arrival, arrival_wall, session);
      });
    } catch (const std::exception& e) {
      spdlog::debug("[frame_pump] executor gone: {}", e.what());
      return;
    }

    // Wait for the frame to be processed so the raw channel's bound applies. Teardown joins this
    // thread from the executor, so never block on the future without watching for stop
    while (done.wait_for(20ms) != std::future_status::ready) {
      if (stop.stop_requested()) return;
    }
    try {
      done.get();
    } catch (const std::exception& e) {
      spdlog::error("[frame_pump] frame processing failed: {}", e.what());
    }
  }
}

void CaptureOrchestrator::signal_window_change() {
  {
    std::lock_guard<std::mutex> lock(settle_mu_);
    settle_pending_ = true;
  }
  settle_cv_.notify_one();
}

void CaptureOrchestrator::settle_window_changes(const StopToken& stop, std::uint64_t session) {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(settle_mu_);
      settle_cv_.wait(lock, [&] { return settle_pending_ || settle_stopping_; });
      if (settle_stopping_) return;
      settle_pending_ = false;
    }

    // Let the activation animation finish, then poll until the frontmost window stops changing
    if (stop.wait_for(milliseconds(tuning_.settle_delay_ms))) return;

    FrameMetadata info = frontmost_metadata(false);
    const auto deadline = std::chrono::steady_clock::now() + milliseconds(tuning_.settle_timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
      if (stop.wait_for(milliseconds(tuning_.settle_poll_ms))) return;

      FrameMetadata next = frontmost_metadata(false);
      const bool settled = next.app_bundle_id == info.app_bundle_id && next.window_title == info.window_title;
      info = std::move(next);
      if (settled) break;
    }

    executor_.post([this, info, session] { handle_window_change(info, session); });
  }
}

} // namespace rwc
