#ifndef DCTBLUR_MIRROR_PADDING_HPP
#define DCTBLUR_MIRROR_PADDING_HPP

#include <opencv2/core.hpp>

namespace dctblur {

/**
 * @brief Reflects a grid across its right and bottom edges.
 *        [ G      flipLR(G) ]
 *        [ flipUD(G) flip(G) ]
 *        The periodic extension of the result is the even-symmetric extension of G,
 *        so a DFT of it sees no jump at the original borders.
 * @param grid Single-channel H x W matrix, any numeric depth.
 * @return 2H x 2W CV_64FC1 matrix.
 * @throws InvalidDimensionError if the grid is empty.
 */
cv::Mat mirrorPad(const cv::Mat& grid);

/**
 * @brief Copies the top-left quadrant of size `sourceSize` back out of a padded grid.
 * @throws ShapeMismatchError if sourceSize does not fit inside `padded`.
 */
cv::Mat cropToSource(const cv::Mat& padded, const cv::Size& sourceSize);

} // namespace dctblur

#endif // DCTBLUR_MIRROR_PADDING_HPP
