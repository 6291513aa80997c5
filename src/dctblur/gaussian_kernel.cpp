#include "dctblur/gaussian_kernel.hpp"
#include "dctblur/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace dctblur {

namespace {

constexpr double kPi = 3.14159265358979323846;

void validateAmount(double amount, const std::string& caller) {
    if (!std::isfinite(amount) || amount <= 0.0) {
        throw InvalidParameterError(caller + ": blur amount must be a positive finite number, got " +
                                    std::to_string(amount) + ".");
    }
}

void validateExtent(int rows, int cols, const std::string& caller) {
    if (rows < 1 || cols < 1) {
        throw InvalidDimensionError(caller + ": mask size must be at least 1x1, got " +
                                    std::to_string(rows) + "x" + std::to_string(cols) + ".");
    }
}

// exp(-k^2 / (2 sigma^2)) for the index that sits at signed distance `distance` from DC.
double gaussianWeight(int distance, double sigma) {
    const double d = static_cast<double>(distance);
    return std::exp(-(d * d) / (2.0 * sigma * sigma));
}

// Per-axis profile as an n x 1 column. `periodic` folds index i onto min(i, n - i).
cv::Mat axisProfile(int n, double sigma, bool periodic) {
    cv::Mat profile(n, 1, CV_64F);
    for (int i = 0; i < n; ++i) {
        const int distance = periodic ? std::min(i, n - i) : i;
        profile.at<double>(i, 0) = gaussianWeight(distance, sigma);
    }
    return profile;
}

cv::Mat outerProduct(const cv::Mat& rowProfile, const cv::Mat& colProfile) {
    cv::Mat mask = rowProfile * colProfile.t();
    // Far tails underflow to 0 for small sigma; keep every multiplier strictly positive.
    cv::max(mask, std::numeric_limits<double>::min(), mask);
    return mask;
}

} // namespace

std::string toString(TransformKind kind) {
    switch (kind) {
        case TransformKind::DCT: return "dct";
        case TransformKind::DFT: return "dft";
    }
    throw InvalidParameterError("toString: unsupported transform kind " +
                                std::to_string(static_cast<int>(kind)) + ".");
}

TransformKind parseTransformKind(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "dct") return TransformKind::DCT;
    if (lowered == "dft") return TransformKind::DFT;
    throw InvalidParameterError("Unsupported transform kind '" + name + "'. Must be 'dct' or 'dft'.");
}

double kernelSigma(int extent, double amount, TransformKind kind) {
    validateAmount(amount, "kernelSigma");
    switch (kind) {
        case TransformKind::DCT: return extent / (kPi * amount);
        case TransformKind::DFT: return extent / (2.0 * kPi * amount);
    }
    throw InvalidParameterError("kernelSigma: unsupported transform kind " +
                                std::to_string(static_cast<int>(kind)) + ".");
}

cv::Mat buildDctKernel(int rows, int cols, double amount) {
    validateExtent(rows, cols, "buildDctKernel");
    validateAmount(amount, "buildDctKernel");

    const double sigmaRows = kernelSigma(rows, amount, TransformKind::DCT);
    const double sigmaCols = kernelSigma(cols, amount, TransformKind::DCT);
    return outerProduct(axisProfile(rows, sigmaRows, false), axisProfile(cols, sigmaCols, false));
}

cv::Mat buildDftKernel(int rows, int cols, double amount) {
    validateExtent(rows, cols, "buildDftKernel");
    validateAmount(amount, "buildDftKernel");

    const double sigmaRows = kernelSigma(rows, amount, TransformKind::DFT);
    const double sigmaCols = kernelSigma(cols, amount, TransformKind::DFT);
    return outerProduct(axisProfile(rows, sigmaRows, true), axisProfile(cols, sigmaCols, true));
}

cv::Mat buildKernel(TransformKind kind, int rows, int cols, double amount) {
    switch (kind) {
        case TransformKind::DCT: return buildDctKernel(rows, cols, amount);
        case TransformKind::DFT: return buildDftKernel(rows, cols, amount);
    }
    throw InvalidParameterError("buildKernel: unsupported transform kind " +
                                std::to_string(static_cast<int>(kind)) + ".");
}

} // namespace dctblur
