#include "dctblur/cosine_transform.hpp"
#include "dctblur/errors.hpp"
#include "dctblur/grid.hpp"

#include <cmath>
#include <string>

namespace dctblur {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Transforms every row of a CV_64FC1 matrix independently.
cv::Mat transformRows(const cv::Mat& src, bool inverse) {
    cv::Mat dst;
    if (src.cols % 2 == 0) {
        cv::dct(src, dst, cv::DCT_ROWS | (inverse ? cv::DCT_INVERSE : 0));
    } else {
        // cv::dct rejects odd lengths; the basis matrix has the same scaling.
        const cv::Mat basis = dctBasis(src.cols);
        dst = inverse ? cv::Mat(src * basis) : cv::Mat(src * basis.t());
    }
    return dst;
}

cv::Mat transformColumns(const cv::Mat& src, bool inverse) {
    cv::Mat transposed = src.t();
    cv::Mat result = transformRows(transposed, inverse).t();
    return result;
}

cv::Mat transform1D(const cv::Mat& input, bool inverse, const std::string& caller) {
    cv::Mat working = toWorkingGrid(input, caller);
    if (working.rows != 1 && working.cols != 1) {
        throw InvalidDimensionError(caller + ": expected a 1 x N or N x 1 sequence, got " +
                                    std::to_string(working.rows) + "x" + std::to_string(working.cols) + ".");
    }
    const bool column = working.cols == 1 && working.rows > 1;
    cv::Mat row = column ? cv::Mat(working.t()) : working;
    cv::Mat out = transformRows(row, inverse);
    if (!column) {
        return out;
    }
    cv::Mat restored = out.t();
    return restored;
}

} // namespace

cv::Mat dctBasis(int n) {
    if (n < 1) {
        throw InvalidDimensionError("dctBasis: transform length must be >= 1, got " + std::to_string(n) + ".");
    }
    cv::Mat basis(n, n, CV_64F);
    const double factor = kPi / (2.0 * n);
    for (int k = 0; k < n; ++k) {
        const double alpha = (k == 0) ? std::sqrt(1.0 / n) : std::sqrt(2.0 / n);
        double* row = basis.ptr<double>(k);
        for (int x = 0; x < n; ++x) {
            row[x] = alpha * std::cos((2 * x + 1) * k * factor);
        }
    }
    return basis;
}

cv::Mat forward1D(const cv::Mat& sequence) {
    return transform1D(sequence, false, "forward1D");
}

cv::Mat inverse1D(const cv::Mat& coeffs) {
    return transform1D(coeffs, true, "inverse1D");
}

cv::Mat forward2D(const cv::Mat& grid) {
    cv::Mat working = toWorkingGrid(grid, "forward2D");
    // The rows pass must finish before the columns pass starts.
    cv::Mat rowsDone = transformRows(working, false);
    return transformColumns(rowsDone, false);
}

cv::Mat inverse2D(const cv::Mat& coeffs) {
    cv::Mat working = toWorkingGrid(coeffs, "inverse2D");
    cv::Mat columnsDone = transformColumns(working, true);
    return transformRows(columnsDone, true);
}

} // namespace dctblur
