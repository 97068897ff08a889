#pragma once

#include <cmath>
#include <opencv2/core.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ringtrack {

/**
 * @brief Sub-pixel image coordinate, origin at the top-left of the frame.
 */
class Pt {
 public:
  double x, y;

  Pt() : x(0), y(0) {}

  Pt(double x, double y) : x(x), y(y) {}

  explicit Pt(const cv::Point2f& p) : x(p.x), y(p.y) {}

  bool operator==(const Pt& other) const {
    return (x == other.x) and (y == other.y);
  }

  bool operator!=(const Pt& other) const { return !(*this == other); }

  Pt operator+(const Pt& other) const { return Pt(x + other.x, y + other.y); }

  Pt operator-(const Pt& other) const { return Pt(x - other.x, y - other.y); }

  cv::Point cv_pt() const {
    return cv::Point(static_cast<int>(std::round(x)),
                     static_cast<int>(std::round(y)));
  }

  cv::Point2f cv_pt2f() const {
    return cv::Point2f(static_cast<float>(x), static_cast<float>(y));
  }

  std::string to_string() const {
    std::ostringstream os;
    os << "(" << x << ", " << y << ")";
    return os.str();
  }

  double distance(const Pt& other) const {
    return std::hypot(x - other.x, y - other.y);
  }

  bool in_radius(const Pt& other, const double radius) const {
    return distance(other) <= radius;
  }
};

// A pixel observation that may be unknown (occluded, lost or never tracked).
using PixelSample = std::optional<Pt>;
using PixelSeries = std::vector<PixelSample>;

}  // namespace ringtrack
