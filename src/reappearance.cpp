#include "ringtrack/reappearance.hpp"
#include <algorithm>
#include "ringtrack/debug.hpp"
#include "ringtrack/errors.hpp"
#include "ringtrack/kalman.hpp"

namespace ringtrack {

namespace {

std::optional<int> last_known(const PixelSeries& series, int frame) {
  const int last = std::min(frame, static_cast<int>(series.size()) - 1);
  for (int f = last; f >= 0; f--) {
    if (series[f]) {
      return f;
    }
  }
  return std::nullopt;
}

}  // namespace

ReappearanceModule::ReappearanceModule(int history,
                                       double sigma_a,
                                       double sigma_z)
    : history(std::max(1, history)), sigma_a(sigma_a), sigma_z(sigma_z) {}

PixelSample ReappearanceModule::get_predicted_point(const PixelSeries& series,
                                                    int frame) const {
  const std::optional<int> last = last_known(series, frame);
  if (!last) {
    return std::nullopt;
  }
  if (*last == frame) {
    return series[frame];
  }

  // First known sample inside the history window seeds the filter.
  int first = std::max(0, *last - history + 1);
  while (!series[first]) {
    first++;
  }

  Kalman kalman(*series[first], 1.0, sigma_a, sigma_z, sigma_z);
  for (int f = first + 1; f <= *last; f++) {
    kalman.predict();
    if (series[f]) {
      kalman.update(*series[f]);
    }
  }
  Pt predicted = kalman.position();
  for (int f = *last + 1; f <= frame; f++) {
    predicted = kalman.predict();
  }
  return predicted;
}

PointInfo ReappearanceModule::get_point_info(const TrackingData& dataset,
                                             int camera,
                                             int z_index,
                                             const std::string& tag,
                                             int frame) const {
  const PixelSeries series = dataset.load_pixel_track(camera, z_index, tag);
  const int frames = static_cast<int>(series.size());
  if (frame < 0 or (frames > 0 and frame >= frames)) {
    throw PreconditionError("frame " + std::to_string(frame) +
                            " outside the pixel table of camera " +
                            std::to_string(camera));
  }

  PointInfo info;
  info.camera = camera;
  info.z_index = z_index;
  info.tag = tag;
  info.frame = frame;
  info.last_frame = last_known(series, frame);
  if (info.last_frame) {
    info.point = series[*info.last_frame];
  }
  info.is_lost = !info.last_frame or *info.last_frame != frame;
  if (info.is_lost) {
    info.predicted_point = get_predicted_point(series, frame);
  }

  RINGTRACK_LOG_DEBUG("point info cam " << camera << " z " << z_index
                                        << " tag " << tag << " frame " << frame
                                        << (info.is_lost ? ": lost"
                                                         : ": tracked"));
  return info;
}

FlowQueue ReappearanceModule::make_continuation(const PointInfo& info,
                                                const Pt& corrected_point,
                                                int end_frame) {
  return FlowQueue(corrected_point, info.frame, end_frame, info.camera,
                   info.z_index, info.tag);
}

}  // namespace ringtrack
