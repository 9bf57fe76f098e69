#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "core/config.hpp"
#include "core/frame.hpp"
#include "platform/platform.hpp"

/*
    WindowMetadataResolver answers "which window is in front on each display" for multi-display
    enrichment. One snapshot of the window list is shared by every frame that arrives within the
    cache TTL, so a capture cycle across N displays costs one OS query instead of N.

    Owned and called by the orchestrator's executor thread only; not thread-safe.
*/

namespace rwc {

using DisplayMetadataMap = std::unordered_map<std::uint32_t, FrameMetadata>;

class WindowMetadataResolver {
public:
  WindowMetadataResolver(std::shared_ptr<DisplayProvider> displays, std::shared_ptr<WindowProvider> windows, TuningConfig tuning);

  // Runtime display id -> metadata of its topmost relevant window. isFocused is always false here
  DisplayMetadataMap top_window_per_display();
  DisplayMetadataMap top_window_per_display(SteadyTime now);

  // Drop the cached snapshot (display topology changed)
  void invalidate();

  // Pure assignment step: runtime display id -> index into 'windows' of its topmost relevant window
  static std::unordered_map<std::uint32_t, std::size_t> AssignTopWindows(const std::vector<DisplayInfo>& displays, const std::vector<WindowSnapshot>& windows, const TuningConfig& tuning);

  static bool IsRelevantWindow(const WindowSnapshot& w, const TuningConfig& tuning);

private:
  DisplayMetadataMap refresh();

  std::shared_ptr<DisplayProvider> displays_;
  std::shared_ptr<WindowProvider> windows_;
  TuningConfig tuning_;

  DisplayMetadataMap cache_;
  std::optional<SteadyTime> cached_at_;
};

} // namespace rwc
