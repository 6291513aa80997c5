#ifndef DCTBLUR_GRID_HPP
#define DCTBLUR_GRID_HPP

#include <opencv2/core.hpp>
#include <string>

namespace dctblur {

/**
 * @brief Validates a caller-supplied grid and returns a private CV_64FC1 copy of it.
 * @param grid Single-channel matrix of any numeric depth.
 * @param caller Name used as the prefix of the exception message.
 * @throws InvalidDimensionError if the grid has zero rows or columns.
 * @throws InvalidParameterError if the grid has more than one channel.
 */
cv::Mat toWorkingGrid(const cv::Mat& grid, const std::string& caller);

// Throws ShapeMismatchError unless both matrices have the same rows x cols.
void requireSameShape(const cv::Mat& a, const cv::Mat& b, const std::string& caller);

} // namespace dctblur

#endif // DCTBLUR_GRID_HPP
