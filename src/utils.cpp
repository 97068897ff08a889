#include "ringtrack/utils.hpp"
#include <cstdint>

namespace ringtrack {
namespace utils {

// How far back an occluded marker's last position is looked up.
constexpr int kOcclusionLookback = 120;

cv::Scalar marker_colour(int index) {
  cv::RNG rng(100 + static_cast<uint64_t>(index));
  return cv::Scalar(rng.uniform(0, 235), rng.uniform(0, 235),
                    rng.uniform(0, 235));
}

void draw_target(cv::Mat& frame, const Pt& target, const cv::Scalar& colour) {
  // Length of the perpendicular lines of the cross
  int line_length = 13;
  const cv::Point c = target.cv_pt();
  cv::line(frame, cv::Point(c.x - line_length, c.y),
           cv::Point(c.x + line_length, c.y), colour, 2);
  cv::line(frame, cv::Point(c.x, c.y - line_length),
           cv::Point(c.x, c.y + line_length), colour, 2);
}

void put_label(cv::Mat& img,
               const std::string& label,
               const Pt& origin,
               const double& font_scale) {
  int font_face = cv::FONT_HERSHEY_SIMPLEX;
  int thickness = 1;
  cv::putText(img, label, origin.cv_pt(), font_face, font_scale,
              cv::Scalar(255, 255, 255), thickness, cv::LINE_AA);
}

int draw_markers(cv::Mat& frame,
                 cv::Mat& mask,
                 const std::vector<PixelSeries>& tracks,
                 const std::vector<std::string>& labels,
                 int frame_index) {
  int drawn = 0;
  for (size_t i = 0; i < tracks.size(); i++) {
    const PixelSeries& track = tracks[i];
    if (frame_index < 0 or frame_index >= static_cast<int>(track.size())) {
      continue;
    }
    if (!track[frame_index]) {
      // Occluded markers are a red cross at their last known position.
      for (int f = frame_index - 1;
           f >= 0 and frame_index - f <= kOcclusionLookback; f--) {
        if (track[f]) {
          draw_target(frame, *track[f], cv::Scalar(0, 0, 235));
          break;
        }
      }
      continue;
    }
    const cv::Scalar colour = marker_colour(static_cast<int>(i));
    const Pt& now = *track[frame_index];
    if (frame_index > 0 and track[frame_index - 1]) {
      cv::line(mask, track[frame_index - 1]->cv_pt(), now.cv_pt(), colour, 2);
    }
    cv::circle(frame, now.cv_pt(), 11, colour, -1);
    if (i < labels.size()) {
      put_label(frame, labels[i], now + Pt(0, 25));
    }
    drawn++;
  }
  return drawn;
}

}  // namespace utils
}  // namespace ringtrack
