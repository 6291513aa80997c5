// File: include/dctblur/compare.hpp
// Purpose: Side-by-side runs of the DCT, DFT and mirrored-DFT blur paths.

#ifndef DCTBLUR_COMPARE_HPP
#define DCTBLUR_COMPARE_HPP

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "dctblur/blur.hpp"

namespace dctblur {

enum class TestPattern {
    EdgeStrip,    // 255 on column 0, 0 elsewhere
    Checkerboard, // 8x8 cells of 0 / 255
    Ramp,         // 0 at the left edge rising to 255 at the right edge
    Noise         // uniform [0, 255) from cv::RNG(seed)
};

std::string toString(TestPattern pattern);

/**
 * @brief Parses "edge-strip", "checkerboard", "ramp" or "noise".
 * @throws InvalidParameterError for any other name.
 */
TestPattern parseTestPattern(const std::string& name);

/**
 * @brief Generates a synthetic CV_64FC1 grid with values in [0, 255].
 * @throws InvalidDimensionError if rows or cols < 1.
 */
cv::Mat makeTestPattern(TestPattern pattern, int rows, int cols, std::uint64_t seed = 42);

struct GridStats {
    double sum = 0.0;
    double energy = 0.0;   // sum of squares
    double mean = 0.0;
    double variance = 0.0; // population variance
};

GridStats computeStats(const cv::Mat& grid);

// Mean absolute value of the last column: how much of an edge-0 feature reached the far edge.
double farEdgeLeakage(const cv::Mat& grid);

struct PathReport {
    std::string label;
    BlurParameters params;
    cv::Mat result;
    GridStats stats;
    double far_edge_leakage = 0.0;
    double elapsed_ms = 0.0;
};

struct ComparisonReport {
    GridStats input_stats;
    double input_far_edge_leakage = 0.0;
    std::vector<PathReport> paths;      // dct, dft, dft+mirror
    double dct_vs_mirror_max_diff = 0.0;
};

/**
 * @brief Runs a single configured blur and measures it.
 */
PathReport runBlurPath(const cv::Mat& grid, const BlurParameters& params, const std::string& label);

/**
 * @brief Blurs the same grid through DCT, plain DFT and mirror-padded DFT.
 * @throws InvalidParameterError if amount is invalid.
 * @throws InvalidDimensionError if the grid is empty.
 */
ComparisonReport compareBlurPaths(const cv::Mat& grid, double amount);

std::string formatReport(const ComparisonReport& report);

} // namespace dctblur

#endif // DCTBLUR_COMPARE_HPP
