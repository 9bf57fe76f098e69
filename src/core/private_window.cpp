#include "core/private_window.hpp"

#include <algorithm>
#include <cctype>

namespace rwc {

static std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool LooksLikePrivateWindow(const std::string& title, const std::vector<std::string>& custom_patterns) {
  if (title.empty()) return false;

  const std::string lower = ToLower(title);

  // Chromium, Edge, Firefox and Brave put these anywhere in the title
  static const char* kContains[] = {"incognito", "inprivate", "private browsing", "private window"};
  for (const char* pattern : kContains) {
    if (lower.find(pattern) != std::string::npos) return true;
  }

  // Safari only appends a suffix; a bare "private" elsewhere is too common in page titles
  if (EndsWith(lower, " \xE2\x80\x94 private") || EndsWith(lower, " - private")) return true;

  for (const auto& pattern : custom_patterns) {
    if (!pattern.empty() && lower.find(ToLower(pattern)) != std::string::npos) return true;
  }
  return false;
}

} // namespace rwc
