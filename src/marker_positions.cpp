#include "ringtrack/marker_positions.hpp"
#include <algorithm>
#include <opencv2/core.hpp>
#include "ringtrack/debug.hpp"
#include "ringtrack/errors.hpp"

namespace ringtrack {

namespace {

constexpr double kOrthonormalTolerance = 1e-6;

Eigen::Vector3d read_vector3(const cv::FileNode& node,
                             const std::string& what) {
  if (!node.isSeq() or node.size() != 3) {
    throw PreconditionError("marker positions: " + what +
                            " must be a sequence of 3 numbers");
  }
  return Eigen::Vector3d(static_cast<double>(node[0]),
                         static_cast<double>(node[1]),
                         static_cast<double>(node[2]));
}

std::vector<MarkerEntry> read_ring(const cv::FileNode& ring, int z_index) {
  if (!ring.isSeq()) {
    throw PreconditionError("marker positions: ring of cross-section " +
                            std::to_string(z_index) + " must be a sequence");
  }
  std::vector<MarkerEntry> entries;
  for (cv::FileNodeIterator it = ring.begin(); it != ring.end(); ++it) {
    const cv::FileNode item = *it;
    if (item["tag"].empty() or item["position"].empty()) {
      throw PreconditionError("marker positions: ring entry needs tag and "
                              "position");
    }
    MarkerEntry entry;
    entry.z_index = z_index;
    entry.tag = static_cast<std::string>(item["tag"]);
    entry.position = read_vector3(item["position"], "position of " + entry.tag);
    entries.push_back(entry);
  }
  return entries;
}

}  // namespace

MarkerPositions::MarkerPositions(const Eigen::Vector3d& origin,
                                 const Eigen::Matrix3d& basis,
                                 int num_cross_sections,
                                 std::vector<MarkerEntry> entries)
    : origin(origin), Q(basis), num_sections(num_cross_sections) {
  if (num_sections <= 0) {
    throw PreconditionError("marker positions: no cross-section");
  }
  if (!(Q * Q.transpose()).isApprox(Eigen::Matrix3d::Identity(),
                                    kOrthonormalTolerance)) {
    throw PreconditionError("marker positions: basis is not orthonormal");
  }

  // Cross-section major, declaration order kept within a cross-section.
  std::stable_sort(entries.begin(), entries.end(),
                   [](const MarkerEntry& a, const MarkerEntry& b) {
                     return a.z_index < b.z_index;
                   });
  section_markers.assign(num_sections, {});
  for (const MarkerEntry& entry : entries) {
    if (entry.z_index < 0 or entry.z_index >= num_sections) {
      throw PreconditionError("marker positions: cross-section index " +
                              std::to_string(entry.z_index) +
                              " out of range for tag " + entry.tag);
    }
    if (contains(entry.z_index, entry.tag)) {
      throw PreconditionError("marker positions: duplicate tag " + entry.tag +
                              " in cross-section " +
                              std::to_string(entry.z_index));
    }
    section_markers[entry.z_index].push_back(
        static_cast<int>(markers.size()));
    markers.push_back(entry);
  }
}

MarkerPositions MarkerPositions::from_yaml(const std::string& path) {
  cv::FileStorage fs;
  try {
    fs.open(path, cv::FileStorage::READ);
  } catch (const cv::Exception& e) {
    throw PreconditionError("cannot parse marker positions " + path + ": " +
                            e.what());
  }
  if (!fs.isOpened()) {
    throw PreconditionError("marker positions file not found: " + path);
  }

  Eigen::Vector3d origin = Eigen::Vector3d::Zero();
  if (!fs["origin"].empty()) {
    origin = read_vector3(fs["origin"], "origin");
  }

  Eigen::Matrix3d basis = Eigen::Matrix3d::Identity();
  const cv::FileNode basis_node = fs["basis"];
  if (!basis_node.empty()) {
    if (!basis_node.isSeq() or basis_node.size() != 9) {
      throw PreconditionError("marker positions: basis must hold 9 numbers");
    }
    for (int i = 0; i < 9; i++) {
      basis(i / 3, i % 3) = static_cast<double>(basis_node[i]);
    }
  }

  std::vector<MarkerEntry> entries;
  int num_cross_sections = 0;
  const cv::FileNode sections = fs["cross_sections"];
  if (!sections.empty()) {
    if (!sections.isSeq()) {
      throw PreconditionError("marker positions: cross_sections must be a "
                              "sequence");
    }
    num_cross_sections = static_cast<int>(sections.size());
    for (int z = 0; z < num_cross_sections; z++) {
      std::vector<MarkerEntry> ring = read_ring(sections[z], z);
      entries.insert(entries.end(), ring.begin(), ring.end());
    }
  } else {
    if (fs["ring"].empty() or fs["num_cross_sections"].empty()) {
      throw PreconditionError("marker positions " + path +
                              ": need cross_sections or ring with "
                              "num_cross_sections");
    }
    num_cross_sections = static_cast<int>(fs["num_cross_sections"]);
    for (int z = 0; z < num_cross_sections; z++) {
      std::vector<MarkerEntry> ring = read_ring(fs["ring"], z);
      entries.insert(entries.end(), ring.begin(), ring.end());
    }
  }

  MarkerPositions positions(origin, basis, num_cross_sections,
                            std::move(entries));
  RINGTRACK_LOG_DEBUG("loaded " << positions.num_markers() << " markers on "
                                << positions.size() << " cross-sections from "
                                << path);
  return positions;
}

std::vector<std::string> MarkerPositions::tags(int z_index) const {
  std::vector<std::string> out;
  if (z_index < 0 or z_index >= num_sections) {
    return out;
  }
  for (int idx : section_markers[z_index]) {
    out.push_back(markers[idx].tag);
  }
  return out;
}

std::vector<std::string> MarkerPositions::all_tags() const {
  std::vector<std::string> out;
  for (const MarkerEntry& entry : markers) {
    if (std::find(out.begin(), out.end(), entry.tag) == out.end()) {
      out.push_back(entry.tag);
    }
  }
  return out;
}

bool MarkerPositions::contains(int z_index, const std::string& tag) const {
  if (z_index < 0 or z_index >= static_cast<int>(section_markers.size())) {
    return false;
  }
  for (int idx : section_markers[z_index]) {
    if (markers[idx].tag == tag) {
      return true;
    }
  }
  return false;
}

int MarkerPositions::marker_index(int z_index, const std::string& tag) const {
  if (z_index >= 0 and z_index < num_sections) {
    for (int idx : section_markers[z_index]) {
      if (markers[idx].tag == tag) {
        return idx;
      }
    }
  }
  throw PreconditionError("unknown marker: cross-section " +
                          std::to_string(z_index) + ", tag " + tag);
}

Eigen::Vector3d MarkerPositions::get_position(int z_index,
                                              const std::string& tag) const {
  return markers[marker_index(z_index, tag)].position;
}

bool MarkerPositions::operator==(const MarkerPositions& other) const {
  if (num_sections != other.num_sections or
      markers.size() != other.markers.size() or origin != other.origin or
      Q != other.Q) {
    return false;
  }
  for (size_t i = 0; i < markers.size(); i++) {
    if (markers[i].z_index != other.markers[i].z_index or
        markers[i].tag != other.markers[i].tag or
        markers[i].position != other.markers[i].position) {
      return false;
    }
  }
  return true;
}

}  // namespace ringtrack
