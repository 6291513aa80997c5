#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include "dctblur/errors.hpp"
#include "dctblur/mirror_padding.hpp"
#include "test_helpers.hpp"

class MirrorPaddingTest : public ::testing::Test {
protected:
    void SetUp() override {
        grid_ = (cv::Mat_<double>(2, 3) << 1, 2, 3,
                                           4, 5, 6);
    }

    cv::Mat grid_;
};

TEST_F(MirrorPaddingTest, QuadrantLayout) {
    cv::Mat expected = (cv::Mat_<double>(4, 6) << 1, 2, 3, 3, 2, 1,
                                                  4, 5, 6, 6, 5, 4,
                                                  4, 5, 6, 6, 5, 4,
                                                  1, 2, 3, 3, 2, 1);
    cv::Mat padded = dctblur::mirrorPad(grid_);
    ASSERT_EQ(padded.type(), CV_64FC1);
    EXPECT_TRUE(CompareMatrices(padded, expected, 0.0));
}

TEST_F(MirrorPaddingTest, PaddedGridIsEvenAboutTheOriginalEdges) {
    cv::Mat grid = makeRandomGrid(5, 7, 3);
    cv::Mat padded = dctblur::mirrorPad(grid);
    ASSERT_EQ(padded.size(), cv::Size(14, 10));
    for (int r = 0; r < padded.rows; ++r) {
        for (int c = 0; c < padded.cols; ++c) {
            EXPECT_DOUBLE_EQ(padded.at<double>(r, c), padded.at<double>(r, padded.cols - 1 - c));
            EXPECT_DOUBLE_EQ(padded.at<double>(r, c), padded.at<double>(padded.rows - 1 - r, c));
        }
    }
}

TEST_F(MirrorPaddingTest, CropRecoversSource) {
    cv::Mat grid = makeRandomGrid(6, 4, 11);
    cv::Mat cropped = dctblur::cropToSource(dctblur::mirrorPad(grid), grid.size());
    EXPECT_TRUE(CompareMatrices(cropped, grid, 0.0));
}

TEST_F(MirrorPaddingTest, CropDoesNotAliasPaddedGrid) {
    cv::Mat padded = dctblur::mirrorPad(grid_);
    cv::Mat cropped = dctblur::cropToSource(padded, grid_.size());
    padded.setTo(0.0);
    EXPECT_TRUE(CompareMatrices(cropped, grid_, 0.0));
}

TEST_F(MirrorPaddingTest, IntegerInputIsLeftUntouched) {
    cv::Mat grid = (cv::Mat_<uchar>(1, 2) << 10, 200);
    cv::Mat original = grid.clone();
    cv::Mat padded = dctblur::mirrorPad(grid);
    EXPECT_EQ(padded.type(), CV_64FC1);
    EXPECT_DOUBLE_EQ(padded.at<double>(1, 3), 10.0);
    EXPECT_TRUE(CompareMatrices(grid, original, 0.0));
}

TEST_F(MirrorPaddingTest, InvalidInput) {
    EXPECT_THROW(dctblur::mirrorPad(cv::Mat()), dctblur::InvalidDimensionError);
    EXPECT_THROW(dctblur::cropToSource(grid_, cv::Size(4, 2)), dctblur::ShapeMismatchError);
    EXPECT_THROW(dctblur::cropToSource(cv::Mat(), cv::Size(1, 1)), dctblur::ShapeMismatchError);
    EXPECT_THROW(dctblur::cropToSource(grid_, cv::Size(0, 1)), dctblur::InvalidDimensionError);
}
