#pragma once

#include <string>
#include <utility>
#include "pt.hpp"

namespace ringtrack {

/**
 * @brief One tracking job: propagate the seed point of marker (z_index, tag)
 * in camera `camera` from start_frame up to (excluding) end_frame.
 * end_frame == -1 tracks until the end of the video.
 */
struct FlowQueue {
  Pt point;
  int start_frame = 0;
  int end_frame = -1;
  int camera = 0;
  int z_index = 0;
  std::string tag;
  bool done = false;

  FlowQueue() = default;

  FlowQueue(Pt point,
            int start_frame,
            int end_frame,
            int camera,
            int z_index,
            std::string tag)
      : point(point),
        start_frame(start_frame),
        end_frame(end_frame),
        camera(camera),
        z_index(z_index),
        tag(std::move(tag)) {}

  // Two jobs of the same batch are tracked in a single pass over the video.
  bool same_batch(const FlowQueue& other) const {
    return camera == other.camera and start_frame == other.start_frame and
           end_frame == other.end_frame;
  }

  std::string to_string() const {
    return "cam " + std::to_string(camera) + " z " + std::to_string(z_index) +
           " tag " + tag + " frames [" + std::to_string(start_frame) + ", " +
           std::to_string(end_frame) + ") seed " + point.to_string();
  }
};

}  // namespace ringtrack
