#include "dctblur/grid.hpp"
#include "dctblur/errors.hpp"

namespace dctblur {

cv::Mat toWorkingGrid(const cv::Mat& grid, const std::string& caller) {
    if (grid.empty() || grid.rows < 1 || grid.cols < 1) {
        throw InvalidDimensionError(caller + ": grid has zero rows or columns.");
    }
    if (grid.dims != 2) {
        throw InvalidDimensionError(caller + ": grid must be two-dimensional.");
    }
    if (grid.channels() != 1) {
        throw InvalidParameterError(caller + ": only single-channel grids are supported (got " +
                                    std::to_string(grid.channels()) + " channels).");
    }

    // convertTo into an empty destination always allocates, so the result never aliases the input.
    cv::Mat working;
    grid.convertTo(working, CV_64F);
    return working;
}

void requireSameShape(const cv::Mat& a, const cv::Mat& b, const std::string& caller) {
    if (a.size() != b.size()) {
        throw ShapeMismatchError(caller + ": shape mismatch " +
                                 std::to_string(a.rows) + "x" + std::to_string(a.cols) + " vs " +
                                 std::to_string(b.rows) + "x" + std::to_string(b.cols) + ".");
    }
}

} // namespace dctblur
