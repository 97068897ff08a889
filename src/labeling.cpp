#include "ringtrack/labeling.hpp"
#include <filesystem>
#include <opencv2/core.hpp>
#include "ringtrack/debug.hpp"
#include "ringtrack/errors.hpp"

namespace ringtrack {

LabelingSession::LabelingSession(const MarkerPositions& marker_positions)
    : marker_positions(marker_positions) {}

FlowQueue LabelingSession::make_seed(const Pt& point,
                                     int start_frame,
                                     int end_frame,
                                     int camera,
                                     int z_index,
                                     const std::optional<std::string>& tag) {
  std::string selected;
  if (tag and !tag->empty()) {
    selected = *tag;
  } else if (previous_tag) {
    selected = *previous_tag;
  } else {
    throw PreconditionError("seed at frame " + std::to_string(start_frame) +
                            " has no tag and no previous tag");
  }
  marker_positions.marker_index(z_index, selected);
  if (start_frame < 0) {
    throw PreconditionError("negative start frame for seed of tag " +
                            selected);
  }
  previous_tag = selected;
  return FlowQueue(point, start_frame, end_frame, camera, z_index, selected);
}

std::vector<FlowQueue> LabelingSession::read_seeds(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw PreconditionError("seed file not found: " + path);
  }
  cv::FileStorage fs;
  try {
    fs.open(path, cv::FileStorage::READ);
  } catch (const cv::Exception& e) {
    throw PreconditionError("cannot parse seed file " + path + ": " + e.what());
  }
  if (!fs.isOpened()) {
    throw PreconditionError("cannot open seed file " + path);
  }

  const cv::FileNode seeds = fs["seeds"];
  if (!seeds.isSeq()) {
    throw PreconditionError(path + ": 'seeds' must be a sequence");
  }

  std::vector<FlowQueue> queues;
  for (const cv::FileNode& node : seeds) {
    const cv::FileNode point = node["point"];
    if (!point.isSeq() or point.size() != 2) {
      throw PreconditionError(path + ": seed point must be [x, y]");
    }
    if (node["start_frame"].empty() or node["camera"].empty() or
        node["z_index"].empty()) {
      throw PreconditionError(path +
                              ": seed needs start_frame, camera and z_index");
    }
    const int end_frame =
        node["end_frame"].empty() ? -1 : static_cast<int>(node["end_frame"]);
    std::optional<std::string> tag;
    if (!node["tag"].empty()) {
      tag = static_cast<std::string>(node["tag"]);
    }
    queues.push_back(make_seed(
        Pt(static_cast<double>(point[0]), static_cast<double>(point[1])),
        static_cast<int>(node["start_frame"]), end_frame,
        static_cast<int>(node["camera"]), static_cast<int>(node["z_index"]),
        tag));
  }
  RINGTRACK_LOG_INFO("read " << queues.size() << " seeds from " << path);
  return queues;
}

}  // namespace ringtrack
