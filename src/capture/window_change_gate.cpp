#include "capture/window_change_gate.hpp"

#include <cctype>

namespace rwc {

WindowChangeGate::WindowChangeGate(std::chrono::milliseconds debounce) : debounce_(debounce) {}

static bool IsOpenBracket(char c) { return c == '(' || c == '['; }
static char ClosingFor(char c) { return c == '(' ? ')' : ']'; }

std::string WindowChangeGate::StripCounters(const std::string& title) {
  std::string out;
  out.reserve(title.size());

  for (std::size_t i = 0; i < title.size(); ++i) {
    if (IsOpenBracket(title[i])) {
      const char close = ClosingFor(title[i]);
      std::size_t j = i + 1;
      while (j < title.size() && std::isdigit(static_cast<unsigned char>(title[j]))) ++j;
      if (j > i + 1 && j < title.size() && title[j] == close) {
        i = j;
        continue;
      }
    }
    out.push_back(title[i]);
  }

  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  std::size_t begin = 0;
  while (begin < out.size() && !not_space(out[begin])) ++begin;
  std::size_t end = out.size();
  while (end > begin && !not_space(out[end - 1])) --end;
  return out.substr(begin, end - begin);
}

bool WindowChangeGate::TitlesRelated(const std::string& a, const std::string& b) {
  const std::string sa = StripCounters(a);
  const std::string sb = StripCounters(b);
  if (sa.empty() || sb.empty()) return false;
  return sa.find(sb) != std::string::npos || sb.find(sa) != std::string::npos;
}

bool WindowChangeGate::should_capture(const std::optional<std::string>& app_id, const std::optional<std::string>& title, SteadyTime now) {
  // Cosmetic title change within the same app
  if (app_id_ && app_id == app_id_ && title && title_ && TitlesRelated(*title, *title_)) {
    return false;
  }

  if (last_trigger_ && now - *last_trigger_ < debounce_) {
    return false;
  }

  app_id_ = app_id;
  title_ = title;
  last_trigger_ = now;
  return true;
}

void WindowChangeGate::reset() {
  app_id_.reset();
  title_.reset();
  last_trigger_.reset();
}

} // namespace rwc
