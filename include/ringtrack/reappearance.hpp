#pragma once

#include <optional>
#include <string>
#include "flow_queue.hpp"
#include "pt.hpp"
#include "tracking_data.hpp"

namespace ringtrack {

/**
 * @brief What the operator needs to re-acquire a marker at `frame`.
 */
struct PointInfo {
  int camera = 0;
  int z_index = 0;
  std::string tag;
  int frame = 0;
  std::optional<int> last_frame;  // last frame <= frame with a known position
  PixelSample point;              // position at last_frame
  bool is_lost = true;            // unknown at `frame`
  PixelSample predicted_point;    // motion-model guess at `frame` when lost
};

/**
 * @brief Predicts where a lost marker should reappear.
 *
 * A constant-velocity Kalman filter is run over the last known samples of
 * the marker's pixel series and extrapolated to the requested frame. The
 * prediction only assists the operator; nothing is re-detected
 * automatically.
 */
class ReappearanceModule {
 private:
  int history;
  double sigma_a;
  double sigma_z;

 public:
  explicit ReappearanceModule(int history = 30,
                              double sigma_a = 1.0,
                              double sigma_z = 1.0);

  /**
   * @brief Predicted position at `frame` from the samples before it, or
   * nullopt when the marker was never seen up to `frame`.
   */
  PixelSample get_predicted_point(const PixelSeries& series, int frame) const;

  PointInfo get_point_info(const TrackingData& dataset,
                           int camera,
                           int z_index,
                           const std::string& tag,
                           int frame) const;

  /**
   * @brief Seed job continuing the marker from the operator's corrected
   * position at info.frame.
   */
  static FlowQueue make_continuation(const PointInfo& info,
                                     const Pt& corrected_point,
                                     int end_frame = -1);
};

}  // namespace ringtrack
