#include <cstdint>
#include <set>
#include <string>

#include "core/display_identity.hpp"
#include "test_support.hpp"

static rwc::DisplayHardwareInfo Hw(std::uint32_t vendor, std::uint32_t model, std::uint32_t serial, int w = 0, int h = 0) {
  rwc::DisplayHardwareInfo hw;
  hw.vendor = vendor;
  hw.model = model;
  hw.serial = serial;
  hw.pixel_width = w;
  hw.pixel_height = h;
  return hw;
}

static void FnvReferenceValues() {
  CHECK_EQ(rwc::Fnv1a32(""), 2166136261u);
  CHECK_EQ(rwc::Fnv1a32("a"), 0xE40C292Cu);
  CHECK_EQ(rwc::Fnv1a32("") & 0x7FFFFFFFu, 18652613u);
}

static void FingerprintRules() {
  CHECK_EQ(rwc::DisplayFingerprint(Hw(0, 0, 0, 1920, 1080), 69734208), std::string("runtime:69734208"));
  CHECK_EQ(rwc::DisplayFingerprint(Hw(4268, 16620, 808661324), 2), std::string("4268:16620:808661324"));
  CHECK_EQ(rwc::DisplayFingerprint(Hw(1552, 41240, 0, 3024, 1964), 1), std::string("1552:41240:3024x1964"));

  CHECK(rwc::IsSessionScopedIdentity(Hw(0, 0, 0)));
  CHECK(!rwc::IsSessionScopedIdentity(Hw(0, 0, 5)));
}

static void StableIdIgnoresRuntimeHandleWhenHardwareIsKnown() {
  const auto hw = Hw(4268, 16620, 808661324);
  CHECK_EQ(rwc::StableDisplayId(hw, 1), rwc::StableDisplayId(hw, 7));
  CHECK_EQ(rwc::StableDisplayId(hw, 1), rwc::Fnv1a32("4268:16620:808661324") & 0x7FFFFFFFu);

  // Only hardware-less displays fall back to the runtime handle
  CHECK(rwc::StableDisplayId(Hw(0, 0, 0), 1) != rwc::StableDisplayId(Hw(0, 0, 0), 2));
}

// Persisted ids: these values must never change
static void PinnedIdsForPersistedFingerprints() {
  CHECK_EQ(rwc::StableDisplayId(Hw(1552, 41240, 0, 3024, 1964), 1), 1886620472u);
  CHECK(rwc::DisplayFingerprint(Hw(1552, 41240, 0, 3024, 1964), 1).find(' ') == std::string::npos);
}

static void IdenticalPanelsWithoutSerialDifferByResolution() {
  CHECK(rwc::StableDisplayId(Hw(1552, 41240, 0, 2560, 1440), 1) != rwc::StableDisplayId(Hw(1552, 41240, 0, 1920, 1080), 1));
}

static void IdsAreNonZeroAndFitSigned32() {
  std::set<std::uint32_t> seen;
  for (std::uint32_t serial = 1; serial <= 500; ++serial) {
    const std::uint32_t id = rwc::StableDisplayId(Hw(4268, 16620, serial), 1);
    CHECK(id != 0);
    CHECK(id <= 0x7FFFFFFFu);
    seen.insert(id);
  }
  CHECK_EQ(seen.size(), std::size_t{500});
}

int main() {
  FnvReferenceValues();
  FingerprintRules();
  StableIdIgnoresRuntimeHandleWhenHardwareIsKnown();
  PinnedIdsForPersistedFingerprints();
  IdenticalPanelsWithoutSerialDifferByResolution();
  IdsAreNonZeroAndFitSigned32();
  return rwc_test::Finish("display_identity");
}
