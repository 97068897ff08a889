#pragma once

#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "flow_queue.hpp"
#include "frame_source.hpp"
#include "reappearance.hpp"
#include "tracking_data.hpp"

namespace ringtrack {

/**
 * @brief Outcome of one FlowQueue job.
 */
struct FlowResult {
  FlowQueue queue;
  bool skipped = false;           // nothing was written
  int frames_tracked = 0;         // frames with a position, seed included
  std::optional<int> lost_frame;  // first frame where the flow failed
  bool batch_lost = false;        // every point of the batch was lost
  bool read_failed = false;       // the video ended before end_frame
};

/**
 * @brief Pyramidal Lucas-Kanade point tracker of one camera.
 *
 * Jobs are executed in the order given. Consecutive jobs with the same
 * (start_frame, end_frame) are tracked together in one pass over the video.
 * A point whose flow fails is lost for the rest of its job; its later frames
 * are written as unknown. If every point of a batch is
 * lost the batch stops early. Lost markers are handed back to the operator
 * through get_point_info() and continued with a new FlowQueue.
 */
class CameraOpticalFlow {
 private:
  FrameSource& source;
  TrackingData& dataset;
  const int camera;
  const FlowParams params;
  ReappearanceModule reappearance_module;

  std::vector<FlowResult> track_batch(const std::vector<FlowQueue>& batch);

 public:
  CameraOpticalFlow(FrameSource& source,
                    TrackingData& dataset,
                    int camera,
                    const FlowParams& params = FlowParams());

  int num_frames() const { return source.frame_count(); }

  /**
   * @brief Execute the jobs in order and store their trajectories. A job of
   * another camera or an unknown marker is a PreconditionError.
   */
  std::vector<FlowResult> run(const std::vector<FlowQueue>& queues);

  // Execute every job of this camera that has not run yet.
  std::vector<FlowResult> run_pending();

  PointInfo get_point_info(int z_index, const std::string& tag,
                           int frame) const;

  /**
   * @brief Write the video with the stored trajectories drawn over it.
   */
  void render_tracking_video(const std::string& save_path);
};

}  // namespace ringtrack
