#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "platform/platform.hpp"

/*
    ReplayPlatform serves the capture core from the config instead of a live desktop. Each display
    replays the images of its image_dir in file name order, looping, or a synthesized still frame when
    no directory is given. Window lists are empty, so multi-display enrichment falls back to the
    frontmost app on the focused display.

    Used by capture_daemon to exercise the whole pipeline on machines without a screen capture backend.
*/

namespace rwc {

class ReplayPlatform : public ScreenRasterizer,
                       public DisplayProvider,
                       public WindowProvider,
                       public AppInfoProvider,
                       public PermissionProvider,
                       public PlatformEvents {
public:
  // Throws std::runtime_error if an image_dir is missing or holds no readable images
  explicit ReplayPlatform(ReplayConfig cfg);

  cv::Mat capture_display(std::uint32_t runtime_id) override;

  std::vector<DisplayInfo> list_displays() override;
  std::uint32_t active_display_id() override;
  DisplayHardwareInfo hardware_info(std::uint32_t runtime_id) override;

  std::vector<WindowSnapshot> list_on_screen_windows() override;
  std::optional<AppIdentity> application_for_pid(int pid) override;

  FrameMetadata frontmost_app_info(bool include_browser_url) override;

  bool has_capture_permission() override;

  Subscription subscribe(PlatformEventHandlers handlers) override;
  void unsubscribe(Subscription id) override;

  // Bundle one instance as every collaborator of the orchestrator
  static Platform AsPlatform(const std::shared_ptr<ReplayPlatform>& replay);

private:
  struct Track {
    ReplayDisplayConfig display;
    std::vector<std::string> files;
    std::size_t next{0};
    cv::Mat still;
  };

  const Track& track_for(std::uint32_t runtime_id) const;

  ReplayConfig cfg_;

  mutable std::mutex mu_;
  std::map<std::uint32_t, Track> tracks_;
  std::map<Subscription, PlatformEventHandlers> subscribers_;
  Subscription next_subscription_{1};
};

// Image files (png, jpg, jpeg, bmp) directly inside 'dir', sorted by name
std::vector<std::string> ListImageFiles(const std::string& dir);

} // namespace rwc
