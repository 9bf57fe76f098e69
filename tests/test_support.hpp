#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include "core/errors.hpp"
#include "core/frame.hpp"
#include "platform/platform.hpp"

/*
    Shared helpers for the test executables: CHECK macros that count failures instead of aborting,
    a polling wait, test images, and FakePlatform, a scripted implementation of every platform
    interface with call counters and manually fired notifications.
*/

namespace rwc_test {

inline int& Failures() {
  static int failures = 0;
  return failures;
}

inline void Fail(const char* file, int line, const std::string& what) {
  ++Failures();
  std::cerr << file << ":" << line << ": FAILED: " << what << "\n";
}

// Print a summary and turn the failure count into main()'s return value
inline int Finish(const char* suite) {
  if (Failures() == 0) {
    std::cout << "[" << suite << "] all checks passed\n";
    return 0;
  }
  std::cout << "[" << suite << "] " << Failures() << " check(s) failed\n";
  return 1;
}

// Poll 'pred' until it holds or 'timeout' passes. Returns the last result
template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

// Horizontal BGRA gradient. Decreasing (bright left, dark right) hashes to all ones, increasing to 0
inline cv::Mat Gradient(int width, int height, bool decreasing) {
  cv::Mat img(height, width, CV_8UC4);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      const int v = (x * 255) / (width - 1);
      const auto c = static_cast<unsigned char>(decreasing ? 255 - v : v);
      img.at<cv::Vec4b>(y, x) = cv::Vec4b(c, c, c, 255);
    }
  }
  return img;
}

inline rwc::DisplayInfo MakeDisplay(std::uint32_t id, cv::Rect bounds, bool is_main = false) {
  rwc::DisplayInfo d;
  d.runtime_id = id;
  d.bounds = bounds;
  d.name = "display " + std::to_string(id);
  d.is_main = is_main;
  return d;
}

inline rwc::WindowSnapshot MakeWindow(std::uint32_t id, int pid, const std::string& owner, const std::string& title, cv::Rect bounds) {
  rwc::WindowSnapshot w;
  w.window_id = id;
  w.owner_pid = pid;
  w.owner_name = owner;
  w.title = title;
  w.bounds = bounds;
  return w;
}

class FakePlatform : public rwc::ScreenRasterizer,
                     public rwc::DisplayProvider,
                     public rwc::WindowProvider,
                     public rwc::AppInfoProvider,
                     public rwc::PermissionProvider,
                     public rwc::PlatformEvents {
public:
  // Rasterizer: scripted images per display are served first. Once a script runs dry the display
  // either fails (fail_when_exhausted) or serves its default image
  cv::Mat capture_display(std::uint32_t runtime_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++capture_calls_[runtime_id];

    auto& script = scripts_[runtime_id];
    if (!script.empty()) {
      cv::Mat img = script.front();
      script.pop_front();
      return img;
    }
    if (fail_when_exhausted_) throw rwc::CaptureFailure("scripted failure on display " + std::to_string(runtime_id));
    return default_image_.clone();
  }

  std::vector<rwc::DisplayInfo> list_displays() override {
    std::lock_guard<std::mutex> lock(mu_);
    return displays_;
  }

  std::uint32_t active_display_id() override {
    std::lock_guard<std::mutex> lock(mu_);
    return active_display_;
  }

  rwc::DisplayHardwareInfo hardware_info(std::uint32_t runtime_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = hardware_.find(runtime_id);
    return it == hardware_.end() ? rwc::DisplayHardwareInfo{} : it->second;
  }

  std::vector<rwc::WindowSnapshot> list_on_screen_windows() override {
    std::lock_guard<std::mutex> lock(mu_);
    ++window_list_calls_;
    return windows_;
  }

  std::optional<rwc::AppIdentity> application_for_pid(int pid) override {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = apps_.find(pid);
    if (it == apps_.end()) return std::nullopt;
    return it->second;
  }

  rwc::FrameMetadata frontmost_app_info(bool include_browser_url) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++frontmost_calls_;
    rwc::FrameMetadata md = frontmost_;
    if (!include_browser_url) md.browser_url.reset();
    return md;
  }

  bool has_capture_permission() override {
    std::lock_guard<std::mutex> lock(mu_);
    return permission_;
  }

  Subscription subscribe(rwc::PlatformEventHandlers handlers) override {
    std::lock_guard<std::mutex> lock(mu_);
    const Subscription id = next_subscription_++;
    handlers_[id] = std::move(handlers);
    return id;
  }

  void unsubscribe(Subscription id) override {
    std::lock_guard<std::mutex> lock(mu_);
    handlers_.erase(id);
  }

  // Scripting

  void set_displays(std::vector<rwc::DisplayInfo> displays) {
    std::lock_guard<std::mutex> lock(mu_);
    displays_ = std::move(displays);
  }

  void set_active_display(std::uint32_t id) {
    std::lock_guard<std::mutex> lock(mu_);
    active_display_ = id;
  }

  void set_hardware(std::uint32_t id, rwc::DisplayHardwareInfo hw) {
    std::lock_guard<std::mutex> lock(mu_);
    hardware_[id] = hw;
  }

  void script_frames(std::uint32_t id, std::vector<cv::Mat> frames) {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& f : frames) scripts_[id].push_back(std::move(f));
  }

  void set_default_image(cv::Mat img) {
    std::lock_guard<std::mutex> lock(mu_);
    default_image_ = std::move(img);
  }

  void set_fail_when_exhausted(bool fail) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_when_exhausted_ = fail;
  }

  void set_windows(std::vector<rwc::WindowSnapshot> windows) {
    std::lock_guard<std::mutex> lock(mu_);
    windows_ = std::move(windows);
  }

  void set_app(int pid, rwc::AppIdentity app) {
    std::lock_guard<std::mutex> lock(mu_);
    apps_[pid] = std::move(app);
  }

  void set_frontmost(rwc::FrameMetadata md) {
    std::lock_guard<std::mutex> lock(mu_);
    frontmost_ = std::move(md);
  }

  void set_permission(bool granted) {
    std::lock_guard<std::mutex> lock(mu_);
    permission_ = granted;
  }

  // Notifications run on the calling thread, like a platform callback would

  void emit_topology_changed() {
    for (auto& h : handlers()) if (h.on_display_topology_changed) h.on_display_topology_changed();
  }

  void emit_focused_display_changed(std::uint32_t id) {
    for (auto& h : handlers()) if (h.on_focused_display_changed) h.on_focused_display_changed(id);
  }

  void emit_active_window_changed() {
    for (auto& h : handlers()) if (h.on_active_window_changed) h.on_active_window_changed();
  }

  void emit_capture_stopped_externally() {
    for (auto& h : handlers()) if (h.on_capture_stopped_externally) h.on_capture_stopped_externally();
  }

  void emit_accessibility_denied() {
    for (auto& h : handlers()) if (h.on_accessibility_denied) h.on_accessibility_denied();
  }

  // Counters

  int capture_calls(std::uint32_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = capture_calls_.find(id);
    return it == capture_calls_.end() ? 0 : it->second;
  }

  int window_list_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return window_list_calls_;
  }

  int frontmost_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return frontmost_calls_;
  }

  std::size_t subscriber_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return handlers_.size();
  }

  static rwc::Platform AsPlatform(const std::shared_ptr<FakePlatform>& fake) {
    rwc::Platform p;
    p.rasterizer = fake;
    p.displays = fake;
    p.windows = fake;
    p.apps = fake;
    p.permissions = fake;
    p.events = fake;
    return p;
  }

private:
  std::vector<rwc::PlatformEventHandlers> handlers() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<rwc::PlatformEventHandlers> out;
    for (const auto& kv : handlers_) out.push_back(kv.second);
    return out;
  }

  mutable std::mutex mu_;

  std::vector<rwc::DisplayInfo> displays_;
  std::uint32_t active_display_{0};
  std::map<std::uint32_t, rwc::DisplayHardwareInfo> hardware_;

  std::map<std::uint32_t, std::deque<cv::Mat>> scripts_;
  cv::Mat default_image_{Gradient(64, 48, true)};
  bool fail_when_exhausted_{false};

  std::vector<rwc::WindowSnapshot> windows_;
  std::map<int, rwc::AppIdentity> apps_;
  rwc::FrameMetadata frontmost_;
  bool permission_{true};

  std::map<Subscription, rwc::PlatformEventHandlers> handlers_;
  Subscription next_subscription_{1};

  std::map<std::uint32_t, int> capture_calls_;
  int window_list_calls_{0};
  int frontmost_calls_{0};
};

} // namespace rwc_test

#define CHECK(cond)                                                       \
  do {                                                                    \
    if (!(cond)) ::rwc_test::Fail(__FILE__, __LINE__, #cond);             \
  } while (0)

#define CHECK_EQ(a, b)                                                    \
  do {                                                                    \
    const auto& check_a_ = (a);                                           \
    const auto& check_b_ = (b);                                           \
    if (!(check_a_ == check_b_)) {                                        \
      std::ostringstream check_oss_;                                      \
      check_oss_ << #a " == " #b " (" << check_a_ << " vs " << check_b_ << ")"; \
      ::rwc_test::Fail(__FILE__, __LINE__, check_oss_.str());             \
    }                                                                     \
  } while (0)

#define CHECK_THROWS(expr, ExType)                                        \
  do {                                                                    \
    bool check_threw_ = false;                                            \
    try {                                                                 \
      expr;                                                               \
    } catch (const ExType&) {                                             \
      check_threw_ = true;                                                \
    }                                                                     \
    if (!check_threw_) ::rwc_test::Fail(__FILE__, __LINE__, #expr " did not throw " #ExType); \
  } while (0)
