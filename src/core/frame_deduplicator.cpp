#include "core/frame_deduplicator.hpp"

#include "core/perceptual_hash.hpp"

namespace rwc {

static bool SameDimensions(const DedupReference& a, const DedupReference& b) {
  return a.width == b.width && a.height == b.height;
}

DedupReference FrameDeduplicator::make_reference(const CapturedFrame& frame) const {
  DedupReference ref;
  ref.width = frame.width();
  ref.height = frame.height();
  ref.hash = compute_hash(frame);
  return ref;
}

bool FrameDeduplicator::should_keep(const DedupReference& candidate, const DedupReference* reference, double threshold) const {
  // First frame for this display
  if (!reference) return true;

  // A resolution change is never a duplicate
  if (!SameDimensions(candidate, *reference)) return true;

  return similarity(candidate, *reference) < threshold;
}

bool FrameDeduplicator::should_keep(const CapturedFrame& candidate, const CapturedFrame* reference, double threshold) const {
  if (!reference) return true;
  const DedupReference ref = make_reference(*reference);
  return should_keep(make_reference(candidate), &ref, threshold);
}

std::uint64_t FrameDeduplicator::compute_hash(const CapturedFrame& frame) const {
  return ComputeDifferenceHash(frame.image);
}

double FrameDeduplicator::similarity(const DedupReference& a, const DedupReference& b) const {
  if (!SameDimensions(a, b)) return 0.0;
  return HashSimilarity(a.hash, b.hash);
}

double FrameDeduplicator::similarity(const CapturedFrame& a, const CapturedFrame& b) const {
  return similarity(make_reference(a), make_reference(b));
}

} // namespace rwc
