#pragma once

#include <cstdint>

#include <opencv2/core.hpp>

/*
    Difference hash (dHash). The image is shrunk to a 9x8 grayscale grid and each of the 64 bits
    records whether a cell is brighter than its right-hand neighbour. Compression noise and small
    rendering differences barely move the grid averages, real content changes flip bits.
*/

namespace rwc {

constexpr int kHashGridWidth = 9;
constexpr int kHashGridHeight = 8;
constexpr int kHashBits = 64;

// Bit row*8+col is set when grid[row][col] > grid[row][col+1]. Accepts 1, 3 or 4 channel 8-bit images.
// An empty image hashes to 0
std::uint64_t ComputeDifferenceHash(const cv::Mat& image);

int HammingDistance(std::uint64_t a, std::uint64_t b);

// 1 - hamming/64, in [0, 1]
double HashSimilarity(std::uint64_t a, std::uint64_t b);

} // namespace rwc
