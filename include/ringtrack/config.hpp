#pragma once

#include <map>
#include <opencv2/core.hpp>
#include <string>

namespace ringtrack {

/**
 * @brief Pyramidal Lucas-Kanade parameters. Handed to the tracker at
 * construction and never modified afterwards.
 */
struct FlowParams {
  int window_size = 15;
  int max_level = 3;
  int max_iterations = 35;
  double epsilon = 1e-4;
  double min_eig_threshold = 0.0;

  cv::Size win_size() const { return cv::Size(window_size, window_size); }

  cv::TermCriteria criteria() const {
    return cv::TermCriteria(cv::TermCriteria::COUNT | cv::TermCriteria::EPS,
                            max_iterations, epsilon);
  }

  /**
   * @brief Read a `flow` section; keys that are absent keep their defaults.
   */
  static FlowParams from_node(const cv::FileNode& node);
};

/**
 * @brief Run configuration read from a YAML file.
 *
 * Example:
 * @code
 * %YAML:1.0
 * paths:
 *   footage_video_path: "footage/{tag}/cam{cam}-run{run}.mp4"
 *   tracing_data_path: "data/{tag}/run-{run}.h5"
 *   marker_positions: "marker_positions.yaml"
 *   postprocessing_path: "postprocess/{tag}"
 * flow:
 *   window_size: 15
 *   max_level: 3
 * @endcode
 */
struct Config {
  std::string footage_video_path;
  std::string tracing_data_path;
  std::string marker_positions_path;
  std::string postprocessing_path;
  FlowParams flow;

  static Config load(const std::string& path);

  std::string video_path(const std::string& tag, int cam, int run) const;
  std::string data_path(const std::string& tag, int run) const;
  std::string output_dir(const std::string& tag) const;
};

/**
 * @brief Replace every `{key}` in pattern by fields[key]. Unknown keys are
 * reported as PreconditionError.
 */
std::string format_path(const std::string& pattern,
                        const std::map<std::string, std::string>& fields);

}  // namespace ringtrack
