#include "dctblur/mirror_padding.hpp"
#include "dctblur/errors.hpp"
#include "dctblur/grid.hpp"

#include <string>

namespace dctblur {

cv::Mat mirrorPad(const cv::Mat& grid) {
    cv::Mat working = toWorkingGrid(grid, "mirrorPad");
    const int rows = working.rows;
    const int cols = working.cols;

    cv::Mat padded(2 * rows, 2 * cols, CV_64F);
    cv::Mat topLeft = padded(cv::Rect(0, 0, cols, rows));
    cv::Mat topRight = padded(cv::Rect(cols, 0, cols, rows));
    cv::Mat bottomLeft = padded(cv::Rect(0, rows, cols, rows));
    cv::Mat bottomRight = padded(cv::Rect(cols, rows, cols, rows));

    working.copyTo(topLeft);
    cv::flip(working, topRight, 1);    // around the vertical axis
    cv::flip(working, bottomLeft, 0);  // around the horizontal axis
    cv::flip(working, bottomRight, -1);
    return padded;
}

cv::Mat cropToSource(const cv::Mat& padded, const cv::Size& sourceSize) {
    if (sourceSize.width < 1 || sourceSize.height < 1) {
        throw InvalidDimensionError("cropToSource: source size must be at least 1x1.");
    }
    if (padded.empty() || sourceSize.width > padded.cols || sourceSize.height > padded.rows) {
        throw ShapeMismatchError("cropToSource: " + std::to_string(sourceSize.height) + "x" +
                                 std::to_string(sourceSize.width) + " does not fit inside " +
                                 std::to_string(padded.rows) + "x" + std::to_string(padded.cols) + ".");
    }
    return padded(cv::Rect(0, 0, sourceSize.width, sourceSize.height)).clone();
}

} // namespace dctblur
