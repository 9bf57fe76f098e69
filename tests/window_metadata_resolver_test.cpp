#include <chrono>
#include <memory>

#include "capture/window_metadata_resolver.hpp"
#include "core/display_identity.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using rwc_test::FakePlatform;
using rwc_test::MakeDisplay;
using rwc_test::MakeWindow;

// Two side by side 1920x1080 displays
static std::shared_ptr<FakePlatform> TwoDisplays() {
  auto fake = std::make_shared<FakePlatform>();
  fake->set_displays({MakeDisplay(1, cv::Rect(0, 0, 1920, 1080), true), MakeDisplay(2, cv::Rect(1920, 0, 1920, 1080))});
  return fake;
}

static void WindowGoesToDisplayWithLargestOverlap() {
  const auto fake = TwoDisplays();
  const rwc::TuningConfig tuning;

  // Straddles the seam, mostly on display 2
  const std::vector<rwc::WindowSnapshot> windows = {MakeWindow(10, 100, "Safari", "Docs", cv::Rect(1800, 100, 800, 600))};
  const auto top = rwc::WindowMetadataResolver::AssignTopWindows(fake->list_displays(), windows, tuning);

  CHECK_EQ(top.size(), std::size_t{1});
  CHECK(top.count(2) == 1);
}

static void OverlapTieGoesToFirstDisplay() {
  const auto fake = TwoDisplays();
  const rwc::TuningConfig tuning;

  const std::vector<rwc::WindowSnapshot> windows = {MakeWindow(10, 100, "Safari", "Docs", cv::Rect(1720, 100, 400, 400))};
  const auto top = rwc::WindowMetadataResolver::AssignTopWindows(fake->list_displays(), windows, tuning);

  CHECK(top.count(1) == 1);
  CHECK(top.count(2) == 0);
}

static void FrontmostRelevantWindowWinsPerDisplay() {
  const auto fake = TwoDisplays();
  const rwc::TuningConfig tuning;

  rwc::WindowSnapshot menu_bar = MakeWindow(1, 1, "Window Server", "Menubar", cv::Rect(0, 0, 1920, 25));
  menu_bar.layer = 25;
  rwc::WindowSnapshot ghost = MakeWindow(2, 2, "Overlay", "", cv::Rect(0, 0, 1920, 1080));
  ghost.alpha = 0.0;
  const rwc::WindowSnapshot tiny = MakeWindow(3, 3, "Widget", "w", cv::Rect(10, 10, 40, 40));
  const rwc::WindowSnapshot editor = MakeWindow(4, 4, "Code", "main.cpp", cv::Rect(100, 100, 1200, 800));
  const rwc::WindowSnapshot behind = MakeWindow(5, 5, "Terminal", "zsh", cv::Rect(0, 0, 1920, 1080));

  const std::vector<rwc::WindowSnapshot> windows = {menu_bar, ghost, tiny, editor, behind};
  CHECK(!rwc::WindowMetadataResolver::IsRelevantWindow(menu_bar, tuning));
  CHECK(!rwc::WindowMetadataResolver::IsRelevantWindow(ghost, tuning));
  CHECK(!rwc::WindowMetadataResolver::IsRelevantWindow(tiny, tuning));
  CHECK(rwc::WindowMetadataResolver::IsRelevantWindow(editor, tuning));

  const auto top = rwc::WindowMetadataResolver::AssignTopWindows(fake->list_displays(), windows, tuning);
  CHECK(top.count(1) == 1 && top.at(1) == 3);
  CHECK(top.count(2) == 0);
}

static void MetadataCarriesAppIdentityAndStableId() {
  const auto fake = TwoDisplays();
  rwc::DisplayHardwareInfo hw;
  hw.vendor = 4268;
  hw.model = 16620;
  hw.serial = 42;
  fake->set_hardware(2, hw);
  fake->set_windows({MakeWindow(1, 100, "Mail", "Inbox (3)", cv::Rect(0, 0, 1000, 800)),
                     MakeWindow(2, 200, "Preview", "scan.pdf", cv::Rect(2000, 0, 1000, 800))});
  fake->set_app(100, rwc::AppIdentity{std::string("com.apple.mail"), std::string("Mail")});

  rwc::WindowMetadataResolver resolver(fake, fake, rwc::TuningConfig{});
  const auto md = resolver.top_window_per_display();

  CHECK_EQ(md.size(), std::size_t{2});
  const rwc::FrameMetadata& d1 = md.at(1);
  CHECK(d1.app_bundle_id == std::optional<std::string>("com.apple.mail"));
  CHECK(d1.window_title == std::optional<std::string>("Inbox (3)"));
  CHECK(!d1.is_focused);
  CHECK_EQ(d1.display_id, rwc::StableDisplayId(rwc::DisplayHardwareInfo{}, 1));

  // No app for the pid: owner name stands in, bundle id stays unknown
  const rwc::FrameMetadata& d2 = md.at(2);
  CHECK(!d2.app_bundle_id.has_value());
  CHECK(d2.app_name == std::optional<std::string>("Preview"));
  CHECK_EQ(d2.display_id, rwc::StableDisplayId(hw, 2));
}

static void SnapshotIsCachedForTtl() {
  const auto fake = TwoDisplays();
  fake->set_windows({MakeWindow(1, 100, "Mail", "Inbox", cv::Rect(0, 0, 1000, 800))});

  rwc::TuningConfig tuning;
  tuning.metadata_cache_ttl_ms = 250;
  rwc::WindowMetadataResolver resolver(fake, fake, tuning);

  const rwc::SteadyTime t0 = std::chrono::steady_clock::now();
  resolver.top_window_per_display(t0);
  resolver.top_window_per_display(t0 + 10ms);
  resolver.top_window_per_display(t0 + 200ms);
  CHECK_EQ(fake->window_list_calls(), 1);

  resolver.top_window_per_display(t0 + 300ms);
  CHECK_EQ(fake->window_list_calls(), 2);

  resolver.invalidate();
  resolver.top_window_per_display(t0 + 310ms);
  CHECK_EQ(fake->window_list_calls(), 3);
}

int main() {
  WindowGoesToDisplayWithLargestOverlap();
  OverlapTieGoesToFirstDisplay();
  FrontmostRelevantWindowWinsPerDisplay();
  MetadataCarriesAppIdentityAndStableId();
  SnapshotIsCachedForTtl();
  return rwc_test::Finish("window_metadata_resolver");
}
