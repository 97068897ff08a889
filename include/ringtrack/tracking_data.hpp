#pragma once

#include <H5Cpp.h>
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "flow_queue.hpp"
#include "marker_positions.hpp"
#include "pt.hpp"

namespace ringtrack {

// A 3D marker observation that may be unknown.
using PointSample = std::optional<Eigen::Vector3d>;
using PointSeries = std::vector<PointSample>;

/**
 * @brief Track store of one run, backed by an HDF5 file.
 *
 * Holds the marker layout, the FlowQueue history, one pixel table per camera
 * (frame x marker x {x, y}, NaN on disk for unknown) and the 3D marker tracks
 * with their timestamps produced upstream.
 *
 * The file is open for the lifetime of the object. The FlowQueue history is
 * kept in memory and written by flush(); close() and the destructor flush.
 * Pixel series are written to the file as soon as a job is saved, one write
 * per job, so an aborted session never leaves a half-written job.
 */
class TrackingData {
 private:
  std::string path;
  std::unique_ptr<H5::H5File> file;
  MarkerPositions marker_positions;
  std::vector<FlowQueue> flow_queues;
  bool queues_dirty = false;

  TrackingData(std::string path,
               std::unique_ptr<H5::H5File> file,
               MarkerPositions marker_positions,
               std::vector<FlowQueue> flow_queues);

  void require_open() const;
  void write_marker_positions();
  std::vector<FlowQueue> read_flow_queues() const;
  void write_flow_queues();

  static MarkerPositions read_marker_positions(const H5::H5File& file);
  static std::string camera_path(int camera);
  static std::string track_path(int z_index, const std::string& tag);

 public:
  static const char* const kTimestampsPath;

  /**
   * @brief Create the run file, or reopen it when it already exists. A file
   * that was created with another marker layout is a PreconditionError.
   */
  static std::unique_ptr<TrackingData> initialize(
      const std::string& path,
      const MarkerPositions& marker_positions);

  // Open an existing run file.
  static std::unique_ptr<TrackingData> load(const std::string& path);

  ~TrackingData();
  TrackingData(const TrackingData&) = delete;
  TrackingData& operator=(const TrackingData&) = delete;

  void flush();
  void close();
  bool is_open() const { return file != nullptr; }

  const std::string& get_path() const { return path; }
  const MarkerPositions& get_marker_positions() const {
    return marker_positions;
  }

  /**
   * @brief Record a job in the history log. Throws PreconditionError if the
   * job names a marker that is not in the layout.
   */
  void append(const FlowQueue& queue);

  /**
   * @brief History filtered by camera and start frame; -1 disables a filter.
   */
  std::vector<FlowQueue> get_flow_queues(int camera = -1,
                                         int start_frame = -1) const;

  // Jobs of a camera that have not been executed yet.
  std::vector<FlowQueue> pending_flow_queues(int camera) const;

  /**
   * @brief Write the result of one job.
   *
   * data[i] is the pixel at frame queue.start_frame + i. The frames
   * [start_frame, start_frame + data.size()) of the marker are replaced as a
   * whole, unknown samples included. The camera table is created with
   * num_frames rows on first use. The job is marked done in the history.
   */
  void save_flow_trajectory(const PixelSeries& data,
                            const FlowQueue& queue,
                            int num_frames);

  // Number of frames of a camera's pixel table, 0 if it has none yet.
  int num_frames(int camera) const;

  PixelSeries load_pixel_track(int camera,
                               int z_index,
                               const std::string& tag) const;

  // Every marker's pixel series of one camera, indexed by flat marker index.
  std::vector<PixelSeries> load_pixel_tracks(int camera) const;

  // 3D tracks from the upstream triangulation stage.
  void save_track(int z_index, const std::string& tag,
                  const PointSeries& series);
  std::optional<PointSeries> load_track(int z_index,
                                        const std::string& tag) const;

  bool has_timestamps() const;
  std::vector<double> timestamps() const;
  void set_timestamps(const std::vector<double>& time);
};

}  // namespace ringtrack
