#include "ringtrack/utils.hpp"
#include <gtest/gtest.h>

using namespace ringtrack;

TEST(UtilsTest, MarkerColourIsStable) {
  EXPECT_EQ(utils::marker_colour(3), utils::marker_colour(3));
  EXPECT_NE(utils::marker_colour(0), utils::marker_colour(1));
}

TEST(UtilsTest, DrawMarkersCountsKnownMarkers) {
  cv::Mat frame(100, 100, CV_8UC3, cv::Scalar::all(0));
  cv::Mat mask = cv::Mat::zeros(frame.size(), frame.type());
  const std::vector<PixelSeries> tracks = {
      {Pt(20, 20), Pt(30, 20)},
      {Pt(70, 70), std::nullopt},
      {std::nullopt, std::nullopt}};

  EXPECT_EQ(utils::draw_markers(frame, mask, tracks, {"0-R1", "0-R2", "0-R3"},
                                1),
            1);
  // Trajectory step of the first marker.
  EXPECT_GT(cv::countNonZero(mask.reshape(1)), 0);
  // Occluded second marker is crossed out in red.
  const cv::Vec3b cross = frame.at<cv::Vec3b>(70, 70);
  EXPECT_EQ(cross[2], 235);
  EXPECT_EQ(cross[0], 0);
}

TEST(UtilsTest, FrameOutsideTracksDrawsNothing) {
  cv::Mat frame(50, 50, CV_8UC3, cv::Scalar::all(0));
  cv::Mat mask = frame.clone();
  const std::vector<PixelSeries> tracks = {{Pt(10, 10)}};
  EXPECT_EQ(utils::draw_markers(frame, mask, tracks, {}, 5), 0);
  EXPECT_EQ(cv::countNonZero(frame.reshape(1)), 0);
}
