#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <cmath>
#include <limits>
#include <string>

#include "dctblur/errors.hpp"
#include "dctblur/gaussian_kernel.hpp"
#include "test_helpers.hpp"

using dctblur::TransformKind;

class GaussianKernelTest : public ::testing::Test {
protected:
    const double pi_ = 3.14159265358979323846;
};

TEST_F(GaussianKernelTest, DcTermIsOne) {
    for (TransformKind kind : {TransformKind::DCT, TransformKind::DFT}) {
        SCOPED_TRACE(dctblur::toString(kind));
        cv::Mat mask = dctblur::buildKernel(kind, 12, 17, 3.0);
        ASSERT_EQ(mask.size(), cv::Size(17, 12));
        ASSERT_EQ(mask.type(), CV_64FC1);
        EXPECT_DOUBLE_EQ(mask.at<double>(0, 0), 1.0);
    }
}

TEST_F(GaussianKernelTest, DctValuesMatchClosedForm) {
    const int rows = 20;
    const int cols = 30;
    const double amount = 2.5;
    cv::Mat mask = dctblur::buildDctKernel(rows, cols, amount);

    const double sh = rows / (pi_ * amount);
    const double sw = cols / (pi_ * amount);
    for (int i : {0, 1, 5, 19}) {
        for (int j : {0, 2, 11, 29}) {
            const double expected = std::exp(-(i * i) / (2 * sh * sh)) * std::exp(-(j * j) / (2 * sw * sw));
            EXPECT_NEAR(mask.at<double>(i, j), expected, 1e-12) << "at (" << i << ", " << j << ")";
        }
    }
}

TEST_F(GaussianKernelTest, DctMaskDecaysMonotonically) {
    cv::Mat mask = dctblur::buildDctKernel(25, 16, 1.5);
    for (int i = 0; i < mask.rows; ++i) {
        for (int j = 0; j < mask.cols; ++j) {
            const double v = mask.at<double>(i, j);
            if (i + 1 < mask.rows) EXPECT_GE(v, mask.at<double>(i + 1, j));
            if (j + 1 < mask.cols) EXPECT_GE(v, mask.at<double>(i, j + 1));
        }
    }
}

TEST_F(GaussianKernelTest, DftMaskIsMirroredAcrossQuadrants) {
    for (int rows : {10, 11}) {
        const int cols = 14;
        SCOPED_TRACE("rows = " + std::to_string(rows));
        cv::Mat mask = dctblur::buildDftKernel(rows, cols, 2.0);
        for (int i = 0; i < rows; ++i) {
            for (int j = 0; j < cols; ++j) {
                const double v = mask.at<double>(i, j);
                EXPECT_DOUBLE_EQ(v, mask.at<double>((rows - i) % rows, j));
                EXPECT_DOUBLE_EQ(v, mask.at<double>(i, (cols - j) % cols));
            }
        }
        // Non-increasing from DC up to the Nyquist index along each axis.
        for (int i = 0; i + 1 <= rows / 2; ++i) {
            EXPECT_GE(mask.at<double>(i, 0), mask.at<double>(i + 1, 0));
        }
        for (int j = 0; j + 1 <= cols / 2; ++j) {
            EXPECT_GE(mask.at<double>(0, j), mask.at<double>(0, j + 1));
        }
    }
}

TEST_F(GaussianKernelTest, DftSigmaIsHalfTheDctSigma) {
    EXPECT_DOUBLE_EQ(dctblur::kernelSigma(64, 2.0, TransformKind::DCT),
                     2.0 * dctblur::kernelSigma(64, 2.0, TransformKind::DFT));
    EXPECT_NEAR(dctblur::kernelSigma(64, 2.0, TransformKind::DCT), 64.0 / (pi_ * 2.0), 1e-12);
}

TEST_F(GaussianKernelTest, DftMaskOnDoubledGridMatchesDctMask) {
    // A 2H x 2W periodic grid indexes the same frequencies as an H x W cosine basis.
    const int rows = 9;
    const int cols = 14;
    const double amount = 1.7;
    cv::Mat dft = dctblur::buildDftKernel(2 * rows, 2 * cols, amount);
    cv::Mat dct = dctblur::buildDctKernel(rows, cols, amount);
    EXPECT_TRUE(CompareMatrices(dft(cv::Rect(0, 0, cols, rows)), dct, 1e-12));
}

TEST_F(GaussianKernelTest, ValuesStayStrictlyPositive) {
    // Tiny sigma: the raw exponential underflows far from DC.
    for (TransformKind kind : {TransformKind::DCT, TransformKind::DFT}) {
        SCOPED_TRACE(dctblur::toString(kind));
        cv::Mat mask = dctblur::buildKernel(kind, 128, 128, 500.0);
        double minVal = 0.0;
        double maxVal = 0.0;
        cv::minMaxLoc(mask, &minVal, &maxVal);
        EXPECT_GT(minVal, 0.0);
        EXPECT_LE(maxVal, 1.0);
        EXPECT_TRUE(std::isfinite(minVal));
    }
}

TEST_F(GaussianKernelTest, SingleElementMask) {
    cv::Mat mask = dctblur::buildDftKernel(1, 1, 1.0);
    ASSERT_EQ(mask.total(), 1u);
    EXPECT_DOUBLE_EQ(mask.at<double>(0, 0), 1.0);
}

TEST_F(GaussianKernelTest, InvalidAmount) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    for (double amount : {0.0, -1.0, nan, inf}) {
        EXPECT_THROW(dctblur::buildDctKernel(8, 8, amount), dctblur::InvalidParameterError);
        EXPECT_THROW(dctblur::buildDftKernel(8, 8, amount), dctblur::InvalidParameterError);
        EXPECT_THROW(dctblur::kernelSigma(8, amount, TransformKind::DCT), dctblur::InvalidParameterError);
    }
}

TEST_F(GaussianKernelTest, InvalidSize) {
    EXPECT_THROW(dctblur::buildDctKernel(0, 8, 1.0), dctblur::InvalidDimensionError);
    EXPECT_THROW(dctblur::buildDftKernel(8, 0, 1.0), dctblur::InvalidDimensionError);
}

TEST_F(GaussianKernelTest, TransformKindNames) {
    EXPECT_EQ(dctblur::parseTransformKind("dct"), TransformKind::DCT);
    EXPECT_EQ(dctblur::parseTransformKind("DFT"), TransformKind::DFT);
    EXPECT_EQ(dctblur::toString(TransformKind::DCT), "dct");
    EXPECT_THROW(dctblur::parseTransformKind("wavelet"), dctblur::InvalidParameterError);
    EXPECT_THROW(dctblur::buildKernel(static_cast<TransformKind>(7), 4, 4, 1.0), dctblur::InvalidParameterError);
}
