#include "ringtrack/kalman.hpp"

namespace ringtrack {

Kalman::Kalman(const Pt& initial,
               double dt_,
               double sigma_a,
               double sigma_z_x,
               double sigma_z_y)
    : dt(dt_),
      std_acc(sigma_a),
      std_meas_x(sigma_z_x),
      std_meas_y(sigma_z_y) {
  u << 0, 0;

  // clang-format off

  // Initial state: at the first observation, at rest.
  x << initial.x, initial.y, 0, 0;

  // State transition matrix:
  A << 1, 0, dt,  0,
       0, 1,  0, dt,
       0, 0,  1,  0,
       0, 0,  0,  1;

  // Control input matrix:
  B << (dt * dt) / 2,             0,
                   0, (dt * dt) / 2,
                  dt,             0,
                   0,            dt;

  // Measurement matrix:
  H << 1, 0, 0, 0,
       0, 1, 0, 0;

  // Process noise covariance:
  const double c1 = (dt * dt * dt * dt) / 4;
  const double c2 = (dt * dt * dt) / 2;
  const double c3 = (dt * dt);
  const double sig_a_2 = std_acc * std_acc;

  Q << c1 * sig_a_2,            0, c2 * sig_a_2,            0,
                  0, c1 * sig_a_2,            0, c2 * sig_a_2,
       c2 * sig_a_2,            0, c3 * sig_a_2,            0,
                  0, c2 * sig_a_2,            0, c3 * sig_a_2;

  // Measurement noise covariance:
  R << std_meas_x * std_meas_x,                       0,
                             0, std_meas_y * std_meas_y;

  // clang-format on
}

Pt Kalman::predict() {
  x = A * x + B * u;

  // P = (A * P * A') + Q
  P = A * P * A.transpose() + Q;

  return to_pt(x.head(2));
}

Pt Kalman::update(const Pt& pt) {
  // Calculating Kalman gain (K):
  Eigen::Matrix2d S = (H * P * H.transpose()) + R;
  Eigen::Matrix<double, 4, 2> K = (P * H.transpose()) * S.inverse();

  Eigen::Vector2d z0{pt.x, pt.y};
  x += K * (z0 - (H * x));

  Eigen::Matrix4d I = Eigen::Matrix4d::Identity();

  P = (I - (K * H)) * P;

  return to_pt(x.head(2));
}

}  // namespace ringtrack
