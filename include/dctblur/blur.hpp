// File: include/dctblur/blur.hpp
// Purpose: Frequency-domain Gaussian blur of single-channel grids.

#ifndef DCTBLUR_BLUR_HPP
#define DCTBLUR_BLUR_HPP

#include <opencv2/core.hpp>

#include "dctblur/gaussian_kernel.hpp"

namespace dctblur {

struct BlurParameters {
    double amount = 1.0;                        // spatial standard deviation in samples; larger = more blur
    TransformKind transform = TransformKind::DCT;
    bool mirror_padding = false;                // DFT path only: blur the 2H x 2W reflection, then crop
};

/**
 * @brief Checks a parameter set without touching any grid.
 * @throws InvalidParameterError if amount <= 0 or not finite, the transform kind is unknown,
 *         or mirror_padding is requested together with the DCT path.
 */
void validateParameters(const BlurParameters& params);

/**
 * @brief Multiplies a spectrum by a real mask in place.
 * @param spectrum CV_64FC1 (DCT coefficients) or CV_64FC2 (complex cv::dft output).
 *                 Both planes of a complex spectrum are scaled.
 * @param mask Real multipliers with the same rows x cols as the spectrum.
 * @throws ShapeMismatchError if the shapes differ or the spectrum is neither 1 nor 2 channels.
 */
void applySpectralMask(cv::Mat& spectrum, const cv::Mat& mask);

/**
 * @brief Blurs a grid in the frequency domain.
 *
 * DCT path: forward2D -> multiply by buildDctKernel -> inverse2D. The orthonormal pair
 * needs no rescaling and the implied boundary is mirror-symmetric, so nothing leaks
 * from one edge to the opposite one.
 *
 * DFT path: cv::dft -> multiply by buildDftKernel -> cv::idft with DFT_SCALE. Periodic
 * boundaries; energy near one edge wraps to the opposite edge unless mirror_padding is set.
 *
 * @param grid Single-channel H x W matrix of any numeric depth. Not modified.
 * @return New CV_64FC1 H x W grid.
 * @throws InvalidDimensionError if the grid is empty.
 * @throws InvalidParameterError on invalid parameters or multi-channel input.
 */
cv::Mat blur(const cv::Mat& grid, const BlurParameters& params);

/**
 * @brief Clamps to the representable range of `depth` and rounds to nearest.
 *        CV_8U [0, 255], CV_8S, CV_16U [0, 65535], CV_16S, CV_32S. CV_32F and CV_64F are
 *        converted without clamping.
 * @throws InvalidParameterError for any other depth.
 */
cv::Mat quantizeToDepth(const cv::Mat& grid, int depth);

// blur() followed by quantizeToDepth() back to the input's own depth.
cv::Mat blurToSourceDepth(const cv::Mat& grid, const BlurParameters& params);

} // namespace dctblur

#endif // DCTBLUR_BLUR_HPP
