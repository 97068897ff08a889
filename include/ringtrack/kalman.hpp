/* Discrete constant-velocity Kalman filter on pixel coordinates.
 * Reference:
 * https://machinelearningspace.com/2d-object-tracking-using-kalman-filter/
 */
#pragma once

#include <Eigen/Dense>
#include "pt.hpp"

namespace ringtrack {

class Kalman {
 private:
  double dt;          // Time for one cycle (frames)
  Eigen::Vector2d u;  // Control input
  Eigen::Vector4d x;  // State (position and velocity)

  // Standard deviations of acceleration(sigma_a) and measurement(sigma_z)
  double std_acc = 0, std_meas_x = 0, std_meas_y = 0;

  // State estimation matrix
  Eigen::Matrix4d A;

  // Control input matrix
  Eigen::Matrix<double, 4, 2> B;

  // State-to-measurement domain transformation matrix
  Eigen::Matrix<double, 2, 4> H;

  // Process Noise Covariance
  Eigen::Matrix4d Q;

  // Measurement Noise Covariance
  Eigen::Matrix2d R;

  Eigen::Matrix4d P = Eigen::Matrix4d::Identity();  // Error Covariance

  static Pt to_pt(const Eigen::Vector2d& vec) { return Pt(vec(0), vec(1)); }

 public:
  Kalman(const Pt& initial,
         double dt_ = 1.0,
         double sigma_a = 1.0,
         double sigma_z_x = 1.0,
         double sigma_z_y = 1.0);

  // Time update equations:
  Pt predict();

  // Measurement update equations:
  Pt update(const Pt& pt);

  Pt position() const { return to_pt(x.head(2)); }
  Pt velocity() const { return to_pt(x.tail(2)); }
};

}  // namespace ringtrack
