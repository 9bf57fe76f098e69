#pragma once

#include <string>
#include <vector>

namespace rwc {

// Title-based private/incognito browser window detection.
// Matches the browsers' own title decorations (" - Incognito", "(Private Browsing)", Safari's
// " — Private" suffix, ...) case-insensitively, plus any caller-supplied patterns
bool LooksLikePrivateWindow(const std::string& title, const std::vector<std::string>& custom_patterns);

} // namespace rwc
