#include "ringtrack/optical_flow.hpp"
#include <algorithm>
#include <filesystem>
#include "ringtrack/debug.hpp"
#include "ringtrack/errors.hpp"
#include "ringtrack/utils.hpp"

namespace ringtrack {

CameraOpticalFlow::CameraOpticalFlow(FrameSource& source,
                                     TrackingData& dataset,
                                     int camera,
                                     const FlowParams& params)
    : source(source), dataset(dataset), camera(camera), params(params) {}

std::vector<FlowResult> CameraOpticalFlow::run(
    const std::vector<FlowQueue>& queues) {
  const MarkerPositions& markers = dataset.get_marker_positions();
  for (const FlowQueue& queue : queues) {
    if (queue.camera != camera) {
      throw PreconditionError("job for camera " + std::to_string(queue.camera) +
                              " given to the tracker of camera " +
                              std::to_string(camera));
    }
    markers.marker_index(queue.z_index, queue.tag);
  }

  // Only neighbouring jobs are merged: a later job must overwrite the
  // frames of an earlier one, never the other way round.
  std::vector<std::vector<FlowQueue>> batches;
  for (const FlowQueue& queue : queues) {
    if (!batches.empty() and batches.back().front().same_batch(queue)) {
      batches.back().push_back(queue);
    } else {
      batches.push_back({queue});
    }
  }

  std::vector<FlowResult> results;
  for (const std::vector<FlowQueue>& batch : batches) {
    std::vector<FlowResult> batch_results = track_batch(batch);
    results.insert(results.end(), batch_results.begin(), batch_results.end());
  }
  dataset.flush();
  return results;
}

std::vector<FlowResult> CameraOpticalFlow::run_pending() {
  const std::vector<FlowQueue> pending = dataset.pending_flow_queues(camera);
  RINGTRACK_LOG_INFO("camera " << camera << ": " << pending.size()
                               << " pending flow queues");
  return run(pending);
}

std::vector<FlowResult> CameraOpticalFlow::track_batch(
    const std::vector<FlowQueue>& batch) {
  const int total = num_frames();
  const int start = batch.front().start_frame;
  int end = batch.front().end_frame;
  if (end < 0 or end > total) {
    end = total;
  }

  std::vector<FlowResult> results(batch.size());
  for (size_t i = 0; i < batch.size(); i++) {
    results[i].queue = batch[i];
  }

  if (start < 0 or start >= total) {
    RINGTRACK_LOG_WARN("start frame " << start << " greater than total video "
                                      << "frame " << total << ", skipping "
                                      << batch.size() << " jobs of camera "
                                      << camera);
    for (FlowResult& result : results) {
      result.skipped = true;
    }
    return results;
  }
  if (end <= start) {
    RINGTRACK_LOG_WARN("empty frame range [" << start << ", " << end
                                             << ") on camera " << camera
                                             << ", skipping");
    for (FlowResult& result : results) {
      result.skipped = true;
    }
    return results;
  }

  cv::Mat frame;
  if (!source.seek(start) or !source.read(frame)) {
    throw PreconditionError("cannot read frame " + std::to_string(start) +
                            " of " + source.name());
  }
  cv::Mat old_gray = flat_color(frame);

  const size_t n = batch.size();
  std::vector<PixelSeries> series(n, PixelSeries(end - start));
  std::vector<cv::Point2f> p0(n);
  std::vector<uchar> alive(n, 1);
  for (size_t i = 0; i < n; i++) {
    series[i][0] = batch[i].point;
    p0[i] = batch[i].point.cv_pt2f();
  }

  RINGTRACK_LOG_INFO("camera " << camera << ": tracking " << n
                               << " points over frames [" << start << ", "
                               << end << ")");

  bool batch_lost = false;
  bool read_failed = false;
  std::vector<cv::Point2f> p1;
  std::vector<uchar> status;
  std::vector<float> err;
  for (int f = start + 1; f < end; f++) {
    if (!source.read(frame)) {
      RINGTRACK_LOG_ERROR("video read failed at frame "
                          << f << " of " << source.name() << " (camera "
                          << camera << ", frames [" << start << ", " << end
                          << ")); later frames stay unknown");
      read_failed = true;
      break;
    }
    cv::Mat frame_gray = flat_color(frame);

    cv::calcOpticalFlowPyrLK(old_gray, frame_gray, p0, p1, status, err,
                             params.win_size(), params.max_level,
                             params.criteria(),
                             cv::OPTFLOW_LK_GET_MIN_EIGENVALS,
                             params.min_eig_threshold);

    bool any_alive = false;
    for (size_t i = 0; i < n; i++) {
      if (alive[i] and !status[i]) {
        alive[i] = 0;
        results[i].lost_frame = f;
        RINGTRACK_LOG_DEBUG("lost z " << batch[i].z_index << " tag "
                                      << batch[i].tag << " at frame " << f);
      }
      any_alive = any_alive or alive[i];
    }
    if (!any_alive) {
      // Total occlusion: not an error, the remaining frames stay unknown.
      RINGTRACK_LOG_INFO("camera " << camera << ": all points lost at frame "
                                   << f << ", stopping flow");
      batch_lost = true;
      break;
    }

    for (size_t i = 0; i < n; i++) {
      if (alive[i]) {
        series[i][f - start] = Pt(p1[i]);
      }
    }

    // Now update the previous frame and previous points
    old_gray = frame_gray;
    p0 = p1;
  }

  for (size_t i = 0; i < n; i++) {
    dataset.save_flow_trajectory(series[i], batch[i], total);
    results[i].frames_tracked = static_cast<int>(
        std::count_if(series[i].begin(), series[i].end(),
                      [](const PixelSample& s) { return s.has_value(); }));
    results[i].batch_lost = batch_lost;
    results[i].read_failed = read_failed;
  }
  return results;
}

PointInfo CameraOpticalFlow::get_point_info(int z_index,
                                            const std::string& tag,
                                            int frame) const {
  return reappearance_module.get_point_info(dataset, camera, z_index, tag,
                                            frame);
}

void CameraOpticalFlow::render_tracking_video(const std::string& save_path) {
  RINGTRACK_LOG_INFO("Saving tracking video " << save_path);
  const std::vector<PixelSeries> tracks = dataset.load_pixel_tracks(camera);
  std::vector<std::string> labels;
  for (const MarkerEntry& entry : dataset.get_marker_positions().entries()) {
    labels.push_back(std::to_string(entry.z_index) + "-" + entry.tag);
  }

  const std::filesystem::path parent =
      std::filesystem::path(save_path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  cv::VideoWriter writer(save_path, cv::VideoWriter::fourcc('m', 'p', '4', 'v'),
                         source.fps() > 0 ? source.fps() : 60.0,
                         source.frame_size());
  if (!writer.isOpened()) {
    throw PreconditionError("cannot open video writer " + save_path);
  }
  if (!source.seek(0)) {
    throw PreconditionError("cannot rewind " + source.name());
  }

  cv::Mat frame;
  cv::Mat mask;
  for (int f = 0; f < num_frames(); f++) {
    if (!source.read(frame)) {
      RINGTRACK_LOG_WARN("video ended at frame " << f << " while rendering");
      break;
    }
    if (mask.empty()) {
      mask = cv::Mat::zeros(frame.size(), frame.type());
    }
    utils::draw_markers(frame, mask, tracks, labels, f);
    cv::Mat img;
    cv::add(frame, mask, img);
    writer.write(img);
  }
  writer.release();
}

}  // namespace ringtrack
