#pragma once

#include <cstdint>

#include "core/frame.hpp"

namespace rwc {

// What a kept frame leaves behind for later comparisons: its size and hash, not its pixels
struct DedupReference {
  int width = 0;
  int height = 0;
  std::uint64_t hash = 0;
};

// Stateless near-duplicate check. The caller owns the reference and replaces it on keep
class FrameDeduplicator {
public:
  // Hashes the frame once so the result can be compared and then stored as the next reference
  DedupReference make_reference(const CapturedFrame& frame) const;

  // Keep when there is no reference, when dimensions differ, or when similarity < threshold.
  // Note threshold 1.0 keeps even exact duplicates since 1.0 < 1.0 is false
  bool should_keep(const DedupReference& candidate, const DedupReference* reference, double threshold) const;
  bool should_keep(const CapturedFrame& candidate, const CapturedFrame* reference, double threshold) const;

  std::uint64_t compute_hash(const CapturedFrame& frame) const;

  // 0.0 for frames of different dimensions, otherwise hash similarity in [0, 1]
  double similarity(const DedupReference& a, const DedupReference& b) const;
  double similarity(const CapturedFrame& a, const CapturedFrame& b) const;
};

} // namespace rwc
