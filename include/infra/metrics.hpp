#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

/*
  Metrics.hpp implements Metrics, an object owned by the orchestrator that stores one set of
  counters per display captured this session, and SourceMetrics, the per-display counters a
  CaptureSource updates from its timer thread. Also includes NowNs, which grabs the current steady
  time in nanoseconds integer format.
*/

namespace rwc {

using SteadyClock = std::chrono::steady_clock;

inline std::uint64_t NowNs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          SteadyClock::now().time_since_epoch())
          .count());
}

// Counters for one capture source. Written by the source's timer thread, read by anyone
struct SourceMetrics {
  std::uint32_t display_id{0};

  std::atomic<std::uint64_t> ticks{0};
  std::atomic<std::uint64_t> frames_emitted{0};
  std::atomic<std::uint64_t> failures{0};
  std::atomic<std::uint64_t> immediate_captures{0};
  std::atomic<std::uint64_t> avg_capture_ns{0};
  std::atomic<std::uint64_t> last_tick_ns{0};

  explicit SourceMetrics(std::uint32_t id) : display_id(id) {}

  void on_frame(std::uint64_t capture_ns) {
    ticks.fetch_add(1, std::memory_order_relaxed);
    frames_emitted.fetch_add(1, std::memory_order_relaxed);

    auto prev = avg_capture_ns.load(std::memory_order_relaxed);
    auto next = (prev == 0) ? capture_ns : (prev * 7 + capture_ns) / 8;
    avg_capture_ns.store(next, std::memory_order_relaxed);

    last_tick_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_failure() {
    ticks.fetch_add(1, std::memory_order_relaxed);
    failures.fetch_add(1, std::memory_order_relaxed);
    last_tick_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_immediate() { immediate_captures.fetch_add(1, std::memory_order_relaxed); }
};

// Plain copy of SourceMetrics for handing across threads
struct SourceMetricsSnapshot {
  std::uint32_t display_id{0};
  std::uint64_t ticks{0};
  std::uint64_t frames_emitted{0};
  std::uint64_t failures{0};
  std::uint64_t immediate_captures{0};
  std::uint64_t avg_capture_ns{0};
  std::uint64_t last_tick_ns{0};
};

// Metrics owns SourceMetrics so counters outlive the sources that wrote them (hot-unplug).
// Entries are keyed by display: a source restarted for the same display keeps counting into the
// same entry
class Metrics {
public:
  SourceMetrics* make_source(std::uint32_t display_id) {
    auto& slot = sources_[display_id];
    if (!slot) slot = std::make_unique<SourceMetrics>(display_id);
    return slot.get();
  }

  void clear() { sources_.clear(); }

  std::size_t size() const { return sources_.size(); }

  std::uint64_t failures_total() const {
    std::uint64_t total = 0;
    for (const auto& kv : sources_) total += kv.second->failures.load(std::memory_order_relaxed);
    return total;
  }

  // Ordered by display id
  std::vector<SourceMetricsSnapshot> snapshot() const {
    std::vector<SourceMetricsSnapshot> out;
    out.reserve(sources_.size());
    for (const auto& kv : sources_) {
      const auto& s = kv.second;
      SourceMetricsSnapshot snap;
      snap.display_id = s->display_id;
      snap.ticks = s->ticks.load(std::memory_order_relaxed);
      snap.frames_emitted = s->frames_emitted.load(std::memory_order_relaxed);
      snap.failures = s->failures.load(std::memory_order_relaxed);
      snap.immediate_captures = s->immediate_captures.load(std::memory_order_relaxed);
      snap.avg_capture_ns = s->avg_capture_ns.load(std::memory_order_relaxed);
      snap.last_tick_ns = s->last_tick_ns.load(std::memory_order_relaxed);
      out.push_back(snap);
    }
    return out;
  }

private:
  std::map<std::uint32_t, std::unique_ptr<SourceMetrics>> sources_;
};

} // namespace rwc
