#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "core/frame.hpp"

/*
    Interfaces the capture core consumes. A platform backend (or a test fake) implements them and the
    orchestrator receives them through its constructor; nothing here is a global.

    Calls may come from several threads at once (one timer thread per display plus the orchestrator),
    so implementations must be thread-safe. Any method may throw; the core converts failures into
    log lines, skipped ticks, or start-up errors.
*/

namespace rwc {

class ScreenRasterizer {
public:
  virtual ~ScreenRasterizer() = default;

  // Rasterize one display. Throws CaptureFailure when this attempt fails
  virtual cv::Mat capture_display(std::uint32_t runtime_id) = 0;
};

class DisplayProvider {
public:
  virtual ~DisplayProvider() = default;

  // Connected displays. stable_id may be left 0; the core fills it from hardware_info()
  virtual std::vector<DisplayInfo> list_displays() = 0;

  // Display holding the focused window
  virtual std::uint32_t active_display_id() = 0;

  virtual DisplayHardwareInfo hardware_info(std::uint32_t runtime_id) = 0;
};

class WindowProvider {
public:
  virtual ~WindowProvider() = default;

  // On-screen windows, frontmost first
  virtual std::vector<WindowSnapshot> list_on_screen_windows() = 0;

  virtual std::optional<AppIdentity> application_for_pid(int pid) = 0;
};

class AppInfoProvider {
public:
  virtual ~AppInfoProvider() = default;

  // Frontmost application and its focused window
  virtual FrameMetadata frontmost_app_info(bool include_browser_url) = 0;
};

class PermissionProvider {
public:
  virtual ~PermissionProvider() = default;

  virtual bool has_capture_permission() = 0;
};

// Asynchronous notifications, delivered on whatever thread the platform uses
struct PlatformEventHandlers {
  std::function<void()> on_display_topology_changed;
  std::function<void(std::uint32_t runtime_id)> on_focused_display_changed;
  std::function<void()> on_active_window_changed;
  std::function<void()> on_capture_stopped_externally;
  std::function<void()> on_accessibility_denied;
};

class PlatformEvents {
public:
  using Subscription = std::uint64_t;

  virtual ~PlatformEvents() = default;

  virtual Subscription subscribe(PlatformEventHandlers handlers) = 0;

  // After unsubscribe returns no handler of that subscription runs again
  virtual void unsubscribe(Subscription id) = 0;
};

// Everything the orchestrator needs, bundled for injection
struct Platform {
  std::shared_ptr<ScreenRasterizer> rasterizer;
  std::shared_ptr<DisplayProvider> displays;
  std::shared_ptr<WindowProvider> windows;
  std::shared_ptr<AppInfoProvider> apps;
  std::shared_ptr<PermissionProvider> permissions;
  std::shared_ptr<PlatformEvents> events;
};

} // namespace rwc
