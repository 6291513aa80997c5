#include "dctblur/compare.hpp"
#include "dctblur/errors.hpp"
#include "dctblur/grid.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef DCTBLUR_VERBOSE
#define LOG_COMPARE(message) std::cout << "[COMPARE LOG] " << message << std::endl
#else
#define LOG_COMPARE(message) do { } while (0)
#endif

namespace dctblur {

namespace {

constexpr int kCheckerCell = 8;

} // namespace

std::string toString(TestPattern pattern) {
    switch (pattern) {
        case TestPattern::EdgeStrip: return "edge-strip";
        case TestPattern::Checkerboard: return "checkerboard";
        case TestPattern::Ramp: return "ramp";
        case TestPattern::Noise: return "noise";
    }
    throw InvalidParameterError("toString: unsupported test pattern " +
                                std::to_string(static_cast<int>(pattern)) + ".");
}

TestPattern parseTestPattern(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "edge-strip") return TestPattern::EdgeStrip;
    if (lowered == "checkerboard") return TestPattern::Checkerboard;
    if (lowered == "ramp") return TestPattern::Ramp;
    if (lowered == "noise") return TestPattern::Noise;
    throw InvalidParameterError("Unknown test pattern '" + name +
                                "'. Must be 'edge-strip', 'checkerboard', 'ramp' or 'noise'.");
}

cv::Mat makeTestPattern(TestPattern pattern, int rows, int cols, std::uint64_t seed) {
    if (rows < 1 || cols < 1) {
        throw InvalidDimensionError("makeTestPattern: size must be at least 1x1, got " +
                                    std::to_string(rows) + "x" + std::to_string(cols) + ".");
    }

    cv::Mat grid = cv::Mat::zeros(rows, cols, CV_64F);
    switch (pattern) {
        case TestPattern::EdgeStrip:
            grid.col(0).setTo(255.0);
            break;
        case TestPattern::Checkerboard:
            for (int r = 0; r < rows; ++r) {
                double* row = grid.ptr<double>(r);
                for (int c = 0; c < cols; ++c) {
                    row[c] = ((r / kCheckerCell + c / kCheckerCell) % 2 == 0) ? 255.0 : 0.0;
                }
            }
            break;
        case TestPattern::Ramp:
            for (int c = 0; c < cols; ++c) {
                const double value = (cols > 1) ? 255.0 * c / (cols - 1) : 0.0;
                grid.col(c).setTo(value);
            }
            break;
        case TestPattern::Noise: {
            cv::RNG rng(seed);
            rng.fill(grid, cv::RNG::UNIFORM, 0.0, 255.0);
            break;
        }
    }
    return grid;
}

GridStats computeStats(const cv::Mat& grid) {
    cv::Mat working = toWorkingGrid(grid, "computeStats");
    GridStats stats;
    stats.sum = cv::sum(working)[0];
    stats.energy = working.dot(working);
    const double count = static_cast<double>(working.total());
    stats.mean = stats.sum / count;
    stats.variance = std::max(0.0, stats.energy / count - stats.mean * stats.mean);
    return stats;
}

double farEdgeLeakage(const cv::Mat& grid) {
    cv::Mat working = toWorkingGrid(grid, "farEdgeLeakage");
    cv::Mat lastColumn = cv::abs(working.col(working.cols - 1));
    return cv::mean(lastColumn)[0];
}

PathReport runBlurPath(const cv::Mat& grid, const BlurParameters& params, const std::string& label) {
    PathReport report;
    report.label = label;
    report.params = params;

    auto start_time = std::chrono::high_resolution_clock::now();
    report.result = blur(grid, params);
    auto end_time = std::chrono::high_resolution_clock::now();
    report.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    report.stats = computeStats(report.result);
    report.far_edge_leakage = farEdgeLeakage(report.result);
    LOG_COMPARE(label + ": leakage=" + std::to_string(report.far_edge_leakage) +
                ", " + std::to_string(report.elapsed_ms) + " ms");
    return report;
}

ComparisonReport compareBlurPaths(const cv::Mat& grid, double amount) {
    BlurParameters dct;
    dct.amount = amount;
    dct.transform = TransformKind::DCT;

    BlurParameters dft = dct;
    dft.transform = TransformKind::DFT;

    BlurParameters mirrored = dft;
    mirrored.mirror_padding = true;

    // Fail on bad parameters before any path runs.
    validateParameters(dct);

    ComparisonReport report;
    report.input_stats = computeStats(grid);
    report.input_far_edge_leakage = farEdgeLeakage(grid);
    report.paths.push_back(runBlurPath(grid, dct, "dct"));
    report.paths.push_back(runBlurPath(grid, dft, "dft"));
    report.paths.push_back(runBlurPath(grid, mirrored, "dft+mirror"));

    cv::Mat diff;
    cv::absdiff(report.paths[0].result, report.paths[2].result, diff);
    double maxDiff = 0.0;
    cv::minMaxLoc(diff, nullptr, &maxDiff);
    report.dct_vs_mirror_max_diff = maxDiff;
    return report;
}

std::string formatReport(const ComparisonReport& report) {
    std::ostringstream out;
    out << std::left << std::setw(12) << "path"
        << std::right << std::setw(14) << "sum"
        << std::setw(16) << "energy"
        << std::setw(12) << "variance"
        << std::setw(14) << "far-edge"
        << std::setw(12) << "time(ms)" << "\n";

    out << std::fixed << std::setprecision(4);
    out << std::left << std::setw(12) << "input"
        << std::right << std::setw(14) << report.input_stats.sum
        << std::setw(16) << report.input_stats.energy
        << std::setw(12) << report.input_stats.variance
        << std::setw(14) << report.input_far_edge_leakage
        << std::setw(12) << "-" << "\n";

    for (const auto& path : report.paths) {
        out << std::left << std::setw(12) << path.label
            << std::right << std::setw(14) << path.stats.sum
            << std::setw(16) << path.stats.energy
            << std::setw(12) << path.stats.variance
            << std::setw(14) << path.far_edge_leakage
            << std::setw(12) << path.elapsed_ms << "\n";
    }

    out << std::scientific << std::setprecision(3)
        << "max |dct - (dft+mirror)| = " << report.dct_vs_mirror_max_diff << "\n";
    return out.str();
}

} // namespace dctblur
