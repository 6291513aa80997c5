#include "dctblur/blur.hpp"
#include "dctblur/cosine_transform.hpp"
#include "dctblur/errors.hpp"
#include "dctblur/grid.hpp"
#include "dctblur/mirror_padding.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#ifdef DCTBLUR_VERBOSE
#define LOG_BLUR(message) std::cout << "[BLUR LOG] " << message << std::endl
#else
#define LOG_BLUR(message) do { } while (0)
#endif

namespace dctblur {

namespace {

cv::Mat blurDct(const cv::Mat& working, double amount) {
    cv::Mat coeffs = forward2D(working);
    cv::Mat mask = buildDctKernel(coeffs.rows, coeffs.cols, amount);
    applySpectralMask(coeffs, mask);
    // Orthonormal pair: no rescale after the inverse.
    return inverse2D(coeffs);
}

cv::Mat blurDft(const cv::Mat& working, double amount) {
    cv::Mat spectrum;
    cv::dft(working, spectrum, cv::DFT_COMPLEX_OUTPUT);
    cv::Mat mask = buildDftKernel(spectrum.rows, spectrum.cols, amount);
    applySpectralMask(spectrum, mask);

    // cv::dft is unnormalized; DFT_SCALE divides by rows*cols here and nowhere else.
    // The mask is symmetric under k -> n-k, so the spectrum stays conjugate-symmetric
    // and the real output loses nothing.
    cv::Mat result;
    cv::idft(spectrum, result, cv::DFT_REAL_OUTPUT | cv::DFT_SCALE);
    return result;
}

} // namespace

void validateParameters(const BlurParameters& params) {
    if (!std::isfinite(params.amount) || params.amount <= 0.0) {
        throw InvalidParameterError("Blur amount must be a positive finite number, got " +
                                    std::to_string(params.amount) + ".");
    }
    switch (params.transform) {
        case TransformKind::DCT:
            if (params.mirror_padding) {
                throw InvalidParameterError("Mirror padding applies to the DFT path only; "
                                            "the DCT path already assumes symmetric boundaries.");
            }
            return;
        case TransformKind::DFT:
            return;
    }
    throw InvalidParameterError("Unsupported transform kind " +
                                std::to_string(static_cast<int>(params.transform)) + ".");
}

void applySpectralMask(cv::Mat& spectrum, const cv::Mat& mask) {
    requireSameShape(spectrum, mask, "applySpectralMask");
    if (mask.channels() != 1) {
        throw ShapeMismatchError("applySpectralMask: mask must be single-channel.");
    }

    cv::Mat typedMask;
    mask.convertTo(typedMask, spectrum.depth());

    if (spectrum.channels() == 1) {
        cv::multiply(spectrum, typedMask, spectrum);
    } else if (spectrum.channels() == 2) {
        std::vector<cv::Mat> planes;
        cv::split(spectrum, planes);
        cv::multiply(planes[0], typedMask, planes[0]); // real
        cv::multiply(planes[1], typedMask, planes[1]); // imaginary
        cv::merge(planes, spectrum);
    } else {
        throw ShapeMismatchError("applySpectralMask: spectrum must have 1 or 2 channels, got " +
                                 std::to_string(spectrum.channels()) + ".");
    }
}

cv::Mat blur(const cv::Mat& grid, const BlurParameters& params) {
    validateParameters(params);
    cv::Mat working = toWorkingGrid(grid, "blur");
    LOG_BLUR("blur: " + std::to_string(working.rows) + "x" + std::to_string(working.cols) +
             ", amount=" + std::to_string(params.amount) + ", transform=" + toString(params.transform) +
             (params.mirror_padding ? ", mirrored" : ""));

    cv::Mat result;
    switch (params.transform) {
        case TransformKind::DCT:
            result = blurDct(working, params.amount);
            break;
        case TransformKind::DFT:
            if (params.mirror_padding) {
                cv::Mat padded = mirrorPad(working);
                result = cropToSource(blurDft(padded, params.amount), working.size());
            } else {
                result = blurDft(working, params.amount);
            }
            break;
    }

    requireSameShape(result, working, "blur");
    return result;
}

cv::Mat quantizeToDepth(const cv::Mat& grid, int depth) {
    double lo = 0.0;
    double hi = 0.0;
    bool clamp = true;
    switch (depth) {
        case CV_8U:  lo = 0.0; hi = 255.0; break;
        case CV_8S:  lo = -128.0; hi = 127.0; break;
        case CV_16U: lo = 0.0; hi = 65535.0; break;
        case CV_16S: lo = -32768.0; hi = 32767.0; break;
        case CV_32S:
            lo = static_cast<double>(std::numeric_limits<int>::min());
            hi = static_cast<double>(std::numeric_limits<int>::max());
            break;
        case CV_32F:
        case CV_64F:
            clamp = false;
            break;
        default:
            throw InvalidParameterError("quantizeToDepth: unsupported output depth " + std::to_string(depth) + ".");
    }

    cv::Mat working = toWorkingGrid(grid, "quantizeToDepth");
    if (clamp) {
        cv::max(working, lo, working);
        cv::min(working, hi, working);
    }
    // convertTo rounds to nearest via saturate_cast.
    cv::Mat output;
    working.convertTo(output, depth);
    return output;
}

cv::Mat blurToSourceDepth(const cv::Mat& grid, const BlurParameters& params) {
    cv::Mat blurred = blur(grid, params);
    return quantizeToDepth(blurred, grid.depth());
}

} // namespace dctblur
