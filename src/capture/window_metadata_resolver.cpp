#include "capture/window_metadata_resolver.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/display_identity.hpp"

namespace rwc {

WindowMetadataResolver::WindowMetadataResolver(std::shared_ptr<DisplayProvider> displays, std::shared_ptr<WindowProvider> windows, TuningConfig tuning)
    : displays_(std::move(displays)), windows_(std::move(windows)), tuning_(std::move(tuning)) {}

bool WindowMetadataResolver::IsRelevantWindow(const WindowSnapshot& w, const TuningConfig& tuning) {
  // Menu bars, docks, overlays
  if (w.layer != 0) return false;
  // Invisible or decorative
  if (w.alpha < tuning.min_window_alpha) return false;
  if (w.bounds.width < tuning.min_window_width || w.bounds.height < tuning.min_window_height) return false;
  return true;
}

std::unordered_map<std::uint32_t, std::size_t> WindowMetadataResolver::AssignTopWindows(const std::vector<DisplayInfo>& displays, const std::vector<WindowSnapshot>& windows, const TuningConfig& tuning) {
  std::unordered_map<std::uint32_t, std::size_t> top;

  for (std::size_t i = 0; i < windows.size(); ++i) {
    const WindowSnapshot& w = windows[i];
    if (!IsRelevantWindow(w, tuning)) continue;

    // Largest overlap wins, ties go to the display listed first
    const DisplayInfo* best = nullptr;
    std::int64_t best_area = 0;
    for (const auto& d : displays) {
      const std::int64_t area = static_cast<std::int64_t>((w.bounds & d.bounds).area());
      if (area > best_area) {
        best_area = area;
        best = &d;
      }
    }
    if (!best) continue;

    // List is front to back, so the first window seen per display is the topmost
    top.emplace(best->runtime_id, i);
  }
  return top;
}

DisplayMetadataMap WindowMetadataResolver::top_window_per_display() {
  return top_window_per_display(std::chrono::steady_clock::now());
}

DisplayMetadataMap WindowMetadataResolver::top_window_per_display(SteadyTime now) {
  if (cached_at_ && now - *cached_at_ < std::chrono::milliseconds(tuning_.metadata_cache_ttl_ms)) {
    return cache_;
  }

  cache_ = refresh();
  cached_at_ = now;
  return cache_;
}

void WindowMetadataResolver::invalidate() {
  cache_.clear();
  cached_at_.reset();
}

DisplayMetadataMap WindowMetadataResolver::refresh() {
  std::vector<DisplayInfo> displays;
  std::vector<WindowSnapshot> windows;
  try {
    displays = displays_->list_displays();
    windows = windows_->list_on_screen_windows();
  } catch (const std::exception& e) {
    // Keep serving the last snapshot rather than stripping metadata from every frame
    spdlog::warn("[window_metadata] window enumeration failed: {}", e.what());
    return cache_;
  }

  DisplayMetadataMap out;
  const auto top = AssignTopWindows(displays, windows, tuning_);

  for (const auto& d : displays) {
    const auto it = top.find(d.runtime_id);
    if (it == top.end()) continue;

    const WindowSnapshot& w = windows[it->second];

    FrameMetadata md;
    md.display_id = d.stable_id;
    if (md.display_id == 0) {
      try {
        md.display_id = StableDisplayId(displays_->hardware_info(d.runtime_id), d.runtime_id);
      } catch (const std::exception& e) {
        spdlog::debug("[window_metadata] hardware info for display {} unavailable: {}", d.runtime_id, e.what());
        md.display_id = StableDisplayId(DisplayHardwareInfo{}, d.runtime_id);
      }
    }
    if (!w.title.empty()) md.window_title = w.title;

    std::optional<AppIdentity> app;
    try {
      app = windows_->application_for_pid(w.owner_pid);
    } catch (const std::exception& e) {
      spdlog::debug("[window_metadata] no application for pid {}: {}", w.owner_pid, e.what());
    }
    if (app) {
      md.app_bundle_id = app->bundle_id;
      md.app_name = app->name;
    }
    if (!md.app_name && !w.owner_name.empty()) md.app_name = w.owner_name;

    md.is_focused = false;
    out.emplace(d.runtime_id, std::move(md));
  }

  spdlog::trace("[window_metadata] resolved {} of {} displays from {} windows", out.size(), displays.size(), windows.size());
  return out;
}

} // namespace rwc
