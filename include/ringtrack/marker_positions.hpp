#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace ringtrack {

/**
 * @brief One marker: a tag on the ring of cross-section z_index, with its
 * reference position in the cross-section's local frame.
 */
struct MarkerEntry {
  int z_index;
  std::string tag;
  Eigen::Vector3d position;
};

/**
 * @brief Static marker layout of the specimen.
 *
 * Markers are keyed by (cross-section index, tag). They are kept cross-section
 * major, tags in the order they were declared; that order defines the flat
 * marker index used by the pixel tables. All cross-sections share one local
 * frame given by origin and the orthonormal basis Q (rows are the axes).
 *
 * YAML layout:
 * @code
 * %YAML:1.0
 * origin: [0., 0., 0.]
 * basis: [1., 0., 0., 0., 1., 0., 0., 0., 1.]
 * num_cross_sections: 5
 * ring:
 *   - { tag: R1, position: [0.01, 0., 0.] }
 *   - { tag: R2, position: [0., 0.01, 0.] }
 * cross_sections:            # optional, overrides ring/num_cross_sections
 *   - [ { tag: R1, position: [0.01, 0., 0.] }, ... ]
 * @endcode
 */
class MarkerPositions {
 private:
  Eigen::Vector3d origin;
  Eigen::Matrix3d Q;
  int num_sections;
  std::vector<MarkerEntry> markers;
  std::vector<std::vector<int>> section_markers;

 public:
  MarkerPositions(const Eigen::Vector3d& origin,
                  const Eigen::Matrix3d& basis,
                  int num_cross_sections,
                  std::vector<MarkerEntry> entries);

  static MarkerPositions from_yaml(const std::string& path);

  // Number of cross-sections.
  int size() const { return num_sections; }
  int num_markers() const { return static_cast<int>(markers.size()); }

  std::vector<std::string> tags(int z_index) const;

  // Every tag used by any cross-section, in first-declared order.
  std::vector<std::string> all_tags() const;

  bool contains(int z_index, const std::string& tag) const;

  /**
   * @brief Flat index of (z_index, tag). Throws PreconditionError for an
   * unknown marker.
   */
  int marker_index(int z_index, const std::string& tag) const;

  const MarkerEntry& marker(int index) const { return markers.at(index); }
  const std::vector<MarkerEntry>& entries() const { return markers; }

  Eigen::Vector3d get_position(int z_index, const std::string& tag) const;

  const Eigen::Vector3d& get_origin() const { return origin; }
  const Eigen::Matrix3d& get_basis() const { return Q; }

  bool operator==(const MarkerPositions& other) const;
  bool operator!=(const MarkerPositions& other) const {
    return !(*this == other);
  }
};

}  // namespace ringtrack
