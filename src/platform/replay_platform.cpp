#include "platform/replay_platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace fs = std::filesystem;

namespace rwc {

namespace {

bool HasImageExtension(const fs::path& p) {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp";
}

// Mid gray with the display name, the shape a real desktop grab comes back in (BGRA)
cv::Mat MakeStill(const ReplayDisplayConfig& d) {
  cv::Mat still(d.height, d.width, CV_8UC4, cv::Scalar(96, 96, 96, 255));
  const std::string label = d.name.empty() ? "display " + std::to_string(d.runtime_id) : d.name;
  cv::putText(still, label, cv::Point(d.width / 20, d.height / 2), cv::FONT_HERSHEY_SIMPLEX,
              std::max(1.0, d.height / 360.0), cv::Scalar(255, 255, 255, 255), 2);
  return still;
}

std::optional<std::string> NonEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

} // namespace

std::vector<std::string> ListImageFiles(const std::string& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw std::runtime_error("replay image_dir is not a directory: " + dir);
  }

  std::vector<std::string> files;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.is_regular_file() && HasImageExtension(entry.path())) files.push_back(entry.path().string());
  }
  std::sort(files.begin(), files.end());
  return files;
}

ReplayPlatform::ReplayPlatform(ReplayConfig cfg) : cfg_(std::move(cfg)) {
  for (const auto& d : cfg_.displays) {
    Track t;
    t.display = d;
    if (!d.image_dir.empty()) {
      t.files = ListImageFiles(d.image_dir);
      if (t.files.empty()) throw std::runtime_error("replay image_dir holds no images: " + d.image_dir);
      spdlog::info("[replay] display {} replays {} image(s) from {}", d.runtime_id, t.files.size(), d.image_dir);
    } else {
      t.still = MakeStill(d);
      spdlog::info("[replay] display {} serves a synthesized {}x{} frame", d.runtime_id, d.width, d.height);
    }
    tracks_.emplace(d.runtime_id, std::move(t));
  }
}

const ReplayPlatform::Track& ReplayPlatform::track_for(std::uint32_t runtime_id) const {
  const auto it = tracks_.find(runtime_id);
  if (it == tracks_.end()) throw CaptureFailure("unknown display " + std::to_string(runtime_id));
  return it->second;
}

cv::Mat ReplayPlatform::capture_display(std::uint32_t runtime_id) {
  std::string path;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tracks_.find(runtime_id);
    if (it == tracks_.end()) throw CaptureFailure("unknown display " + std::to_string(runtime_id));

    Track& t = it->second;
    if (t.files.empty()) return t.still.clone();

    path = t.files[t.next];
    t.next = (t.next + 1) % t.files.size();
  }

  // Decode outside the lock; other displays keep capturing meanwhile
  cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
  if (img.empty()) throw CaptureFailure("failed to decode " + path);

  cv::Mat bgra;
  cv::cvtColor(img, bgra, cv::COLOR_BGR2BGRA);
  return bgra;
}

std::vector<DisplayInfo> ReplayPlatform::list_displays() {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<DisplayInfo> out;
  for (const auto& d : cfg_.displays) {
    DisplayInfo info;
    info.runtime_id = d.runtime_id;
    info.bounds = cv::Rect(d.x, d.y, d.width, d.height);
    info.name = d.name;
    info.is_main = d.is_main;
    out.push_back(info);
  }
  return out;
}

std::uint32_t ReplayPlatform::active_display_id() {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& d : cfg_.displays) {
    if (d.is_main) return d.runtime_id;
  }
  return cfg_.displays.empty() ? 0 : cfg_.displays.front().runtime_id;
}

DisplayHardwareInfo ReplayPlatform::hardware_info(std::uint32_t runtime_id) {
  std::lock_guard<std::mutex> lock(mu_);
  const ReplayDisplayConfig& d = track_for(runtime_id).display;

  DisplayHardwareInfo hw;
  hw.vendor = d.vendor;
  hw.model = d.model;
  hw.serial = d.serial;
  hw.pixel_width = d.width;
  hw.pixel_height = d.height;
  return hw;
}

std::vector<WindowSnapshot> ReplayPlatform::list_on_screen_windows() { return {}; }

std::optional<AppIdentity> ReplayPlatform::application_for_pid(int) { return std::nullopt; }

FrameMetadata ReplayPlatform::frontmost_app_info(bool include_browser_url) {
  std::lock_guard<std::mutex> lock(mu_);
  const ReplayAppConfig& app = cfg_.frontmost;

  FrameMetadata md;
  md.app_bundle_id = NonEmpty(app.bundle_id);
  md.app_name = NonEmpty(app.app_name);
  md.window_title = NonEmpty(app.window_title);
  if (include_browser_url) md.browser_url = NonEmpty(app.browser_url);
  return md;
}

bool ReplayPlatform::has_capture_permission() {
  std::lock_guard<std::mutex> lock(mu_);
  return cfg_.has_capture_permission;
}

// Replay never changes topology or focus, so handlers are only held
PlatformEvents::Subscription ReplayPlatform::subscribe(PlatformEventHandlers handlers) {
  std::lock_guard<std::mutex> lock(mu_);
  const Subscription id = next_subscription_++;
  subscribers_.emplace(id, std::move(handlers));
  return id;
}

void ReplayPlatform::unsubscribe(Subscription id) {
  std::lock_guard<std::mutex> lock(mu_);
  subscribers_.erase(id);
}

Platform ReplayPlatform::AsPlatform(const std::shared_ptr<ReplayPlatform>& replay) {
  Platform p;
  p.rasterizer = replay;
  p.displays = replay;
  p.windows = replay;
  p.apps = replay;
  p.permissions = replay;
  p.events = replay;
  return p;
}

} // namespace rwc
