// File: include/dctblur/cosine_transform.hpp
// Purpose: Orthonormal DCT-II / DCT-III pair in one and two dimensions.

#ifndef DCTBLUR_COSINE_TRANSFORM_HPP
#define DCTBLUR_COSINE_TRANSFORM_HPP

#include <opencv2/core.hpp>

namespace dctblur {

/*
 * Normalization convention used everywhere in this library:
 *
 *   X[k] = a(k) * sum_n x[n] * cos(pi * (2n + 1) * k / (2N))
 *   a(0) = sqrt(1/N),  a(k>0) = sqrt(2/N)
 *
 * This is the scaling cv::dct applies. The transform matrix is orthogonal, so
 * inverse(forward(x)) == x with no caller-side rescaling, and X[0] equals
 * sqrt(N) times the mean of x.
 */

/**
 * @brief Builds the orthonormal DCT-II basis matrix.
 * @param n Transform length (>= 1).
 * @return n x n CV_64FC1 matrix C with C(k, x) = a(k) cos(pi (2x+1) k / 2n).
 *         forward = C * x, inverse = C^T * X.
 * @throws InvalidDimensionError if n < 1.
 */
cv::Mat dctBasis(int n);

/**
 * @brief Forward orthonormal DCT-II of a 1D sequence.
 * @param sequence Single-channel 1 x N or N x 1 matrix, any numeric depth.
 * @return CV_64FC1 coefficients with the same shape as the input.
 * @throws InvalidDimensionError if the input is empty or not a vector.
 */
cv::Mat forward1D(const cv::Mat& sequence);

/**
 * @brief Inverse transform (orthonormal DCT-III) of forward1D.
 */
cv::Mat inverse1D(const cv::Mat& coeffs);

/**
 * @brief Separable 2D forward transform: rows pass, then columns pass.
 * @param grid Single-channel H x W matrix, any numeric depth.
 * @return CV_64FC1 H x W coefficient grid, coefficient (0,0) is the DC term.
 * @throws InvalidDimensionError if the grid is empty.
 * @throws InvalidParameterError if the grid has more than one channel.
 */
cv::Mat forward2D(const cv::Mat& grid);

/**
 * @brief Separable 2D inverse transform: columns pass, then rows pass.
 *        inverse2D(forward2D(G)) == G up to rounding.
 */
cv::Mat inverse2D(const cv::Mat& coeffs);

} // namespace dctblur

#endif // DCTBLUR_COSINE_TRANSFORM_HPP
