#include "core/display_identity.hpp"

#include <sstream>

namespace rwc {

static constexpr std::uint32_t kFnvOffsetBasis = 2166136261u;
static constexpr std::uint32_t kFnvPrime = 16777619u;
static constexpr std::uint32_t kSignBitMask = 0x7FFFFFFFu;

std::uint32_t Fnv1a32(const std::string& data) {
  std::uint32_t hash = kFnvOffsetBasis;
  for (const unsigned char c : data) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

bool IsSessionScopedIdentity(const DisplayHardwareInfo& hw) {
  return hw.vendor == 0 && hw.model == 0 && hw.serial == 0;
}

std::string DisplayFingerprint(const DisplayHardwareInfo& hw, std::uint32_t runtime_id) {
  std::ostringstream oss;
  if (IsSessionScopedIdentity(hw)) {
    oss << "runtime:" << runtime_id;
  } else if (hw.serial != 0) {
    oss << hw.vendor << ":" << hw.model << ":" << hw.serial;
  } else {
    oss << hw.vendor << ":" << hw.model << ":" << hw.pixel_width << "x" << hw.pixel_height;
  }
  return oss.str();
}

std::uint32_t StableDisplayId(const DisplayHardwareInfo& hw, std::uint32_t runtime_id) {
  const std::uint32_t id = Fnv1a32(DisplayFingerprint(hw, runtime_id)) & kSignBitMask;
  return id == 0 ? 1u : id;
}

} // namespace rwc
