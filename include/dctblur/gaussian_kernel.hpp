// File: include/dctblur/gaussian_kernel.hpp
// Purpose: Frequency-domain Gaussian masks for the DCT and DFT blur paths.

#ifndef DCTBLUR_GAUSSIAN_KERNEL_HPP
#define DCTBLUR_GAUSSIAN_KERNEL_HPP

#include <opencv2/core.hpp>
#include <string>

namespace dctblur {

enum class TransformKind {
    DCT, // orthonormal cosine transform, mirror-symmetric boundaries
    DFT  // cv::dft, periodic boundaries
};

std::string toString(TransformKind kind);

/**
 * @brief Parses "dct" or "dft" (case-insensitive).
 * @throws InvalidParameterError for any other name.
 */
TransformKind parseTransformKind(const std::string& name);

/**
 * @brief Standard deviation of the mask along one axis, in coefficient-index units.
 *        extent / (pi * amount) for DCT, extent / (2 * pi * amount) for DFT.
 *        Both give a spatial blur whose standard deviation is `amount` samples.
 * @throws InvalidParameterError if amount <= 0 or not finite.
 */
double kernelSigma(int extent, double amount, TransformKind kind);

/**
 * @brief Monotonic Gaussian mask for DCT coefficients.
 *        value(i, j) = exp(-i^2 / (2 sh^2)) * exp(-j^2 / (2 sw^2)), sh = rows/(pi*amount), sw = cols/(pi*amount).
 * @return rows x cols CV_64FC1 mask, 1 at (0,0), strictly positive, non-increasing along each axis.
 * @throws InvalidDimensionError if rows or cols < 1.
 * @throws InvalidParameterError if amount <= 0 or not finite.
 */
cv::Mat buildDctKernel(int rows, int cols, double amount);

/**
 * @brief Gaussian mask laid out for an unshifted cv::dft spectrum.
 *        A quarter profile with sh = rows/(2*pi*amount) (resp. cols) is mirrored onto
 *        the high indices so that index n-k carries the value of index k.
 * @return rows x cols CV_64FC1 mask, 1 at (0,0), non-increasing in |signed frequency|.
 * @throws InvalidDimensionError if rows or cols < 1.
 * @throws InvalidParameterError if amount <= 0 or not finite.
 */
cv::Mat buildDftKernel(int rows, int cols, double amount);

// Dispatches to buildDctKernel / buildDftKernel.
cv::Mat buildKernel(TransformKind kind, int rows, int cols, double amount);

} // namespace dctblur

#endif // DCTBLUR_GAUSSIAN_KERNEL_HPP
