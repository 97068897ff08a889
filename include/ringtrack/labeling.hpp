#pragma once

#include <optional>
#include <string>
#include <vector>
#include "flow_queue.hpp"
#include "marker_positions.hpp"
#include "pt.hpp"

namespace ringtrack {

/**
 * @brief State of one labeling session.
 *
 * A seed given without a tag reuses the tag of the previous seed, the way an
 * operator clicks through the frames of one marker.
 */
class LabelingSession {
 private:
  const MarkerPositions& marker_positions;
  std::optional<std::string> previous_tag;

 public:
  explicit LabelingSession(const MarkerPositions& marker_positions);

  /**
   * @brief Seed job for a clicked point. Throws PreconditionError when no
   * tag is given and none was used before, or the marker is unknown.
   */
  FlowQueue make_seed(const Pt& point,
                      int start_frame,
                      int end_frame,
                      int camera,
                      int z_index,
                      const std::optional<std::string>& tag = std::nullopt);

  /**
   * @brief Seeds from a YAML file:
   * @code
   * %YAML:1.0
   * seeds:
   *   - { point: [412.5, 220.], start_frame: 0, end_frame: -1, camera: 1,
   *       z_index: 0, tag: R1 }
   *   - { point: [430., 221.], start_frame: 0, camera: 1, z_index: 1 }
   * @endcode
   * end_frame defaults to -1; an omitted or empty tag reuses the previous.
   */
  std::vector<FlowQueue> read_seeds(const std::string& path);

  const std::optional<std::string>& get_previous_tag() const {
    return previous_tag;
  }
};

}  // namespace ringtrack
