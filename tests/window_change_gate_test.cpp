#include <chrono>
#include <optional>
#include <string>

#include "capture/window_change_gate.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

static std::optional<std::string> S(const char* s) { return std::string(s); }

static void StripCounters() {
  CHECK_EQ(rwc::WindowChangeGate::StripCounters("Inbox (3)"), std::string("Inbox"));
  CHECK_EQ(rwc::WindowChangeGate::StripCounters("[12] Slack - general"), std::string("Slack - general"));
  CHECK_EQ(rwc::WindowChangeGate::StripCounters("Notes (draft)"), std::string("Notes (draft)"));
  CHECK_EQ(rwc::WindowChangeGate::StripCounters("(1)"), std::string(""));
}

static void TitleRelatedness() {
  CHECK(rwc::WindowChangeGate::TitlesRelated("Inbox (3)", "Inbox (4)"));
  CHECK(rwc::WindowChangeGate::TitlesRelated("main.cpp", "main.cpp - Edited"));
  CHECK(!rwc::WindowChangeGate::TitlesRelated("Inbox", "Compose"));
  CHECK(!rwc::WindowChangeGate::TitlesRelated("", "Inbox"));
}

static void DebounceCollapsesBursts() {
  const rwc::SteadyTime t0{};

  rwc::WindowChangeGate fast(200ms);
  int captures = 0;
  captures += fast.should_capture(S("com.a"), S("One"), t0);
  captures += fast.should_capture(S("com.b"), S("Two"), t0 + 100ms);
  CHECK_EQ(captures, 1);

  rwc::WindowChangeGate slow(200ms);
  captures = 0;
  captures += slow.should_capture(S("com.a"), S("One"), t0);
  captures += slow.should_capture(S("com.b"), S("Two"), t0 + 250ms);
  CHECK_EQ(captures, 2);
}

static void CosmeticTitleChangesAreSuppressed() {
  const rwc::SteadyTime t0{};
  rwc::WindowChangeGate gate(200ms);

  CHECK(gate.should_capture(S("com.apple.mail"), S("Inbox (3)"), t0));
  CHECK(!gate.should_capture(S("com.apple.mail"), S("Inbox (4)"), t0 + 1s));
  CHECK(gate.should_capture(S("com.apple.mail"), S("Compose"), t0 + 2s));

  // Same title in another app is a real switch
  CHECK(gate.should_capture(S("com.other"), S("Compose"), t0 + 3s));
  CHECK(gate.tracked_app() == S("com.other"));
}

static void SuppressedChangeDoesNotMoveTracking() {
  const rwc::SteadyTime t0{};
  rwc::WindowChangeGate gate(200ms);

  CHECK(gate.should_capture(S("com.a"), S("One"), t0));
  CHECK(!gate.should_capture(S("com.b"), S("Two"), t0 + 50ms));
  CHECK(gate.tracked_app() == S("com.a"));
  CHECK(gate.tracked_title() == S("One"));

  gate.reset();
  CHECK(!gate.tracked_app().has_value());
  CHECK(gate.should_capture(S("com.a"), S("One"), t0 + 60ms));
}

int main() {
  StripCounters();
  TitleRelatedness();
  DebounceCollapsesBursts();
  CosmeticTitleChangesAreSuppressed();
  SuppressedChangeDoesNotMoveTracking();
  return rwc_test::Finish("window_change_gate");
}
