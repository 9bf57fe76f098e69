#include "core/perceptual_hash.hpp"

#include <bitset>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace rwc {

// Shrink first so the color conversion only touches 72 pixels
static cv::Mat ToGrayGrid(const cv::Mat& image) {
  cv::Mat small;
  cv::resize(image, small, cv::Size(kHashGridWidth, kHashGridHeight), 0, 0, cv::INTER_AREA);

  cv::Mat gray;
  switch (small.channels()) {
    case 1: gray = small; break;
    case 3: cv::cvtColor(small, gray, cv::COLOR_BGR2GRAY); break;
    case 4: cv::cvtColor(small, gray, cv::COLOR_BGRA2GRAY); break;
    default:
      throw std::invalid_argument("ComputeDifferenceHash: unsupported channel count " + std::to_string(small.channels()));
  }
  return gray;
}

std::uint64_t ComputeDifferenceHash(const cv::Mat& image) {
  if (image.empty()) return 0;
  if (image.depth() != CV_8U) throw std::invalid_argument("ComputeDifferenceHash: expected 8-bit pixels");

  const cv::Mat grid = ToGrayGrid(image);

  std::uint64_t hash = 0;
  for (int row = 0; row < kHashGridHeight; ++row) {
    const std::uint8_t* px = grid.ptr<std::uint8_t>(row);
    for (int col = 0; col < kHashGridWidth - 1; ++col) {
      if (px[col] > px[col + 1]) {
        hash |= (std::uint64_t{1} << (row * (kHashGridWidth - 1) + col));
      }
    }
  }
  return hash;
}

int HammingDistance(std::uint64_t a, std::uint64_t b) {
  return static_cast<int>(std::bitset<kHashBits>(a ^ b).count());
}

double HashSimilarity(std::uint64_t a, std::uint64_t b) {
  return 1.0 - static_cast<double>(HammingDistance(a, b)) / static_cast<double>(kHashBits);
}

} // namespace rwc
