#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "pt.hpp"

namespace ringtrack {
namespace utils {

/**
 * @brief Deterministic colour of the i-th marker in overlays.
 */
cv::Scalar marker_colour(int index);

void draw_target(cv::Mat& frame, const Pt& target, const cv::Scalar& colour);

/**
 * @brief Puts a text label on an image.
 *
 * @param img The image on which the label will be placed.
 * @param label The text string to be placed on the image.
 * @param origin The bottom-left corner of the text string in the image.
 */
void put_label(cv::Mat& img,
               const std::string& label,
               const Pt& origin,
               const double& font_scale = 0.5);

/**
 * @brief Draw the markers of one frame.
 *
 * For every marker known at `frame_index`, a filled dot and its label are
 * drawn on `frame`, and the step from the previous frame is added to the
 * trajectory `mask`, which accumulates over the video. Markers unknown at
 * `frame_index` are drawn as a red cross at their last known position
 * (looked up at most 120 frames back).
 * Returns the number of markers known at `frame_index`.
 */
int draw_markers(cv::Mat& frame,
                 cv::Mat& mask,
                 const std::vector<PixelSeries>& tracks,
                 const std::vector<std::string>& labels,
                 int frame_index);

}  // namespace utils
}  // namespace ringtrack
