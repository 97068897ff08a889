#include "ringtrack/tracking_data.hpp"
#include <cmath>
#include <cstring>
#include <filesystem>
#include <limits>
#include "ringtrack/debug.hpp"
#include "ringtrack/errors.hpp"
#include "ringtrack/h5_io.hpp"

namespace ringtrack {

namespace {

constexpr double kUnknown = std::numeric_limits<double>::quiet_NaN();

const char* const kMarkerGroup = "/marker_positions";
const char* const kFlowQueuePath = "/flow_queues";
const char* const kFlowQueueStaging = "/flow_queues.staging";

struct FlowQueueRecord {
  double x;
  double y;
  int start_frame;
  int end_frame;
  int camera;
  int z_index;
  int done;
  char tag[h5::kTagLength];
};

H5::CompType flow_queue_type() {
  H5::CompType type(sizeof(FlowQueueRecord));
  type.insertMember("x", HOFFSET(FlowQueueRecord, x),
                    H5::PredType::NATIVE_DOUBLE);
  type.insertMember("y", HOFFSET(FlowQueueRecord, y),
                    H5::PredType::NATIVE_DOUBLE);
  type.insertMember("start_frame", HOFFSET(FlowQueueRecord, start_frame),
                    H5::PredType::NATIVE_INT);
  type.insertMember("end_frame", HOFFSET(FlowQueueRecord, end_frame),
                    H5::PredType::NATIVE_INT);
  type.insertMember("camera", HOFFSET(FlowQueueRecord, camera),
                    H5::PredType::NATIVE_INT);
  type.insertMember("z_index", HOFFSET(FlowQueueRecord, z_index),
                    H5::PredType::NATIVE_INT);
  type.insertMember("done", HOFFSET(FlowQueueRecord, done),
                    H5::PredType::NATIVE_INT);
  type.insertMember("tag", HOFFSET(FlowQueueRecord, tag), h5::tag_type());
  return type;
}

bool same_job(const FlowQueue& a, const FlowQueue& b) {
  return a.camera == b.camera and a.z_index == b.z_index and a.tag == b.tag and
         a.start_frame == b.start_frame and a.end_frame == b.end_frame and
         a.point == b.point;
}

std::string job_context(const FlowQueue& queue) {
  return "job " + queue.to_string();
}

}  // namespace

const char* const TrackingData::kTimestampsPath = "/dlt-track/timestamps";

TrackingData::TrackingData(std::string path,
                           std::unique_ptr<H5::H5File> file,
                           MarkerPositions marker_positions,
                           std::vector<FlowQueue> flow_queues)
    : path(std::move(path)),
      file(std::move(file)),
      marker_positions(std::move(marker_positions)),
      flow_queues(std::move(flow_queues)) {}

std::unique_ptr<TrackingData> TrackingData::initialize(
    const std::string& path,
    const MarkerPositions& marker_positions) {
  if (std::filesystem::exists(path)) {
    std::unique_ptr<TrackingData> dataset = load(path);
    if (dataset->get_marker_positions() != marker_positions) {
      throw PreconditionError("marker layout of " + path +
                              " does not match the marker positions");
    }
    RINGTRACK_LOG_DEBUG("reopened tracking data " << path);
    return dataset;
  }

  std::unique_ptr<TrackingData> dataset(new TrackingData(
      path, h5::create_file(path), marker_positions, {}));
  dataset->write_marker_positions();
  dataset->queues_dirty = true;
  dataset->flush();
  RINGTRACK_LOG_INFO("created tracking data " << path << " ("
                                              << marker_positions.num_markers()
                                              << " markers)");
  return dataset;
}

std::unique_ptr<TrackingData> TrackingData::load(const std::string& path) {
  std::unique_ptr<H5::H5File> file =
      h5::open_file(path, h5::Access::READ_WRITE);
  if (!h5::exists(*file, kMarkerGroup)) {
    throw PreconditionError(path + " is not a tracking data file");
  }
  MarkerPositions marker_positions = read_marker_positions(*file);
  std::unique_ptr<TrackingData> dataset(new TrackingData(
      path, std::move(file), std::move(marker_positions), {}));
  dataset->flow_queues = dataset->read_flow_queues();
  return dataset;
}

TrackingData::~TrackingData() {
  try {
    close();
  } catch (const std::exception& e) {
    RINGTRACK_LOG_ERROR("closing " << path << " failed, unsaved flow queue "
                                   << "history is lost: " << e.what());
  }
}

void TrackingData::require_open() const {
  if (file == nullptr) {
    throw PreconditionError("tracking data " + path + " is closed");
  }
}

void TrackingData::flush() {
  require_open();
  if (queues_dirty) {
    write_flow_queues();
    queues_dirty = false;
  }
  try {
    file->flush(H5F_SCOPE_LOCAL);
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot flush " + path + ": " + e.getDetailMsg());
  }
}

void TrackingData::close() {
  if (file == nullptr) {
    return;
  }
  flush();
  try {
    file->close();
  } catch (const H5::Exception& e) {
    file.reset();
    throw PersistenceError("cannot close " + path + ": " + e.getDetailMsg());
  }
  file.reset();
}

void TrackingData::write_marker_positions() {
  const MarkerPositions& mp = marker_positions;
  const std::string group = kMarkerGroup;

  std::vector<double> origin(mp.get_origin().data(),
                             mp.get_origin().data() + 3);
  h5::write_doubles(*file, group + "/origin", origin, {3});

  std::vector<double> basis(9);
  for (int r = 0; r < 3; r++) {
    for (int c = 0; c < 3; c++) {
      basis[r * 3 + c] = mp.get_basis()(r, c);
    }
  }
  h5::write_doubles(*file, group + "/basis", basis, {3, 3});

  std::vector<double> reference;
  std::vector<int> cross_section;
  std::vector<std::string> tags;
  for (const MarkerEntry& entry : mp.entries()) {
    reference.insert(reference.end(),
                     {entry.position.x(), entry.position.y(),
                      entry.position.z()});
    cross_section.push_back(entry.z_index);
    tags.push_back(entry.tag);
  }
  const hsize_t m = static_cast<hsize_t>(mp.num_markers());
  h5::write_doubles(*file, group + "/reference", reference, {m, 3});
  h5::write_ints(*file, group + "/cross_section", cross_section, {m});
  h5::write_strings(*file, group + "/tags", tags);
  h5::write_ints(*file, group + "/num_cross_sections", {mp.size()}, {1});
}

MarkerPositions TrackingData::read_marker_positions(const H5::H5File& file) {
  const std::string group = kMarkerGroup;
  const std::vector<double> origin = h5::read_doubles(file, group + "/origin");
  const std::vector<double> basis = h5::read_doubles(file, group + "/basis");
  const std::vector<double> reference =
      h5::read_doubles(file, group + "/reference");
  const std::vector<int> cross_section =
      h5::read_ints(file, group + "/cross_section");
  const std::vector<std::string> tags = h5::read_strings(file, group + "/tags");
  const std::vector<int> num_sections =
      h5::read_ints(file, group + "/num_cross_sections");

  if (origin.size() != 3 or basis.size() != 9 or num_sections.size() != 1 or
      tags.size() != cross_section.size() or
      reference.size() != 3 * tags.size()) {
    throw PreconditionError("corrupt marker layout in " + file.getFileName());
  }

  Eigen::Matrix3d Q;
  for (int i = 0; i < 9; i++) {
    Q(i / 3, i % 3) = basis[i];
  }
  std::vector<MarkerEntry> entries;
  for (size_t i = 0; i < tags.size(); i++) {
    entries.push_back(MarkerEntry{
        cross_section[i], tags[i],
        Eigen::Vector3d(reference[3 * i], reference[3 * i + 1],
                        reference[3 * i + 2])});
  }
  return MarkerPositions(Eigen::Vector3d(origin[0], origin[1], origin[2]), Q,
                         num_sections[0], std::move(entries));
}

std::vector<FlowQueue> TrackingData::read_flow_queues() const {
  std::vector<FlowQueue> queues;
  if (!h5::exists(*file, kFlowQueuePath)) {
    return queues;
  }
  try {
    H5::DataSet dataset = file->openDataSet(kFlowQueuePath);
    const std::vector<hsize_t> dims = h5::shape(dataset);
    const size_t count = dims.empty() ? 0 : dims[0];
    std::vector<FlowQueueRecord> records(count);
    if (count > 0) {
      dataset.read(records.data(), flow_queue_type());
    }
    for (const FlowQueueRecord& record : records) {
      FlowQueue queue(Pt(record.x, record.y), record.start_frame,
                      record.end_frame, record.camera, record.z_index,
                      std::string(record.tag, strnlen(record.tag,
                                                      h5::kTagLength)));
      queue.done = record.done != 0;
      queues.push_back(queue);
    }
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot read flow queues of " + path + ": " +
                           e.getDetailMsg());
  }
  return queues;
}

void TrackingData::write_flow_queues() {
  std::vector<FlowQueueRecord> records(flow_queues.size());
  for (size_t i = 0; i < flow_queues.size(); i++) {
    const FlowQueue& queue = flow_queues[i];
    FlowQueueRecord& record = records[i];
    std::memset(&record, 0, sizeof(record));
    record.x = queue.point.x;
    record.y = queue.point.y;
    record.start_frame = queue.start_frame;
    record.end_frame = queue.end_frame;
    record.camera = queue.camera;
    record.z_index = queue.z_index;
    record.done = queue.done ? 1 : 0;
    std::strncpy(record.tag, queue.tag.c_str(), h5::kTagLength - 1);
  }

  // Written aside first so the previous history survives a failed write.
  try {
    h5::remove(*file, kFlowQueueStaging);
    const hsize_t dims[1] = {records.size()};
    H5::DataSpace space(1, dims);
    H5::DataSet dataset =
        file->createDataSet(kFlowQueueStaging, flow_queue_type(), space);
    if (!records.empty()) {
      dataset.write(records.data(), flow_queue_type());
    }
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot write flow queues of " + path + ": " +
                           e.getDetailMsg());
  }
  h5::replace(*file, kFlowQueueStaging, kFlowQueuePath);
}

std::string TrackingData::camera_path(int camera) {
  return "/trajectory/camera_" + std::to_string(camera);
}

std::string TrackingData::track_path(int z_index, const std::string& tag) {
  return "/dlt-track/z" + std::to_string(z_index) + "/" + tag;
}

void TrackingData::append(const FlowQueue& queue) {
  require_open();
  marker_positions.marker_index(queue.z_index, queue.tag);
  if (queue.tag.size() >= h5::kTagLength) {
    throw PreconditionError("tag too long: " + queue.tag);
  }
  flow_queues.push_back(queue);
  queues_dirty = true;
  RINGTRACK_LOG_DEBUG("appended " << job_context(queue));
}

std::vector<FlowQueue> TrackingData::get_flow_queues(int camera,
                                                     int start_frame) const {
  std::vector<FlowQueue> out;
  for (const FlowQueue& queue : flow_queues) {
    if (camera != -1 and queue.camera != camera) {
      continue;
    }
    if (start_frame != -1 and queue.start_frame != start_frame) {
      continue;
    }
    out.push_back(queue);
  }
  return out;
}

std::vector<FlowQueue> TrackingData::pending_flow_queues(int camera) const {
  std::vector<FlowQueue> out;
  for (const FlowQueue& queue : flow_queues) {
    if (queue.camera == camera and !queue.done) {
      out.push_back(queue);
    }
  }
  return out;
}

void TrackingData::save_flow_trajectory(const PixelSeries& data,
                                        const FlowQueue& queue,
                                        int num_frames) {
  require_open();
  const int index = marker_positions.marker_index(queue.z_index, queue.tag);
  if (num_frames <= 0 or queue.start_frame < 0 or
      queue.start_frame >= num_frames or
      queue.start_frame + static_cast<int>(data.size()) > num_frames) {
    throw PreconditionError("trajectory does not fit in " +
                            std::to_string(num_frames) + " frames: " +
                            job_context(queue));
  }

  const std::string table = camera_path(queue.camera);
  const hsize_t markers = static_cast<hsize_t>(marker_positions.num_markers());
  try {
    H5::DataSet dataset;
    if (!h5::exists(*file, table)) {
      h5::require_group(*file, "/trajectory");
      const hsize_t dims[3] = {static_cast<hsize_t>(num_frames), markers, 2};
      H5::DataSpace space(3, dims);
      H5::DSetCreatPropList plist;
      const double fill = kUnknown;
      plist.setFillValue(H5::PredType::NATIVE_DOUBLE, &fill);
      dataset = file->createDataSet(table, H5::PredType::NATIVE_DOUBLE, space,
                                    plist);
    } else {
      dataset = file->openDataSet(table);
      const std::vector<hsize_t> dims = h5::shape(dataset);
      if (dims.size() != 3 or dims[0] != static_cast<hsize_t>(num_frames) or
          dims[1] != markers) {
        throw PreconditionError("pixel table " + table + " of " + path +
                                " does not match " +
                                std::to_string(num_frames) + " frames");
      }
    }

    if (!data.empty()) {
      std::vector<double> buffer(data.size() * 2, kUnknown);
      for (size_t i = 0; i < data.size(); i++) {
        if (data[i]) {
          buffer[2 * i] = data[i]->x;
          buffer[2 * i + 1] = data[i]->y;
        }
      }
      const hsize_t count[3] = {data.size(), 1, 2};
      const hsize_t start[3] = {static_cast<hsize_t>(queue.start_frame),
                                static_cast<hsize_t>(index), 0};
      H5::DataSpace file_space = dataset.getSpace();
      file_space.selectHyperslab(H5S_SELECT_SET, count, start);
      H5::DataSpace mem_space(3, count);
      dataset.write(buffer.data(), H5::PredType::NATIVE_DOUBLE, mem_space,
                    file_space);
    }
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot save trajectory to " + path + ", " +
                           job_context(queue) + ": " + e.getDetailMsg());
  }

  bool found = false;
  for (FlowQueue& entry : flow_queues) {
    if (!entry.done and same_job(entry, queue)) {
      entry.done = true;
      found = true;
      break;
    }
  }
  if (!found) {
    FlowQueue executed = queue;
    executed.done = true;
    flow_queues.push_back(executed);
  }
  queues_dirty = true;
}

int TrackingData::num_frames(int camera) const {
  require_open();
  const std::string table = camera_path(camera);
  if (!h5::exists(*file, table)) {
    return 0;
  }
  try {
    return static_cast<int>(h5::shape(file->openDataSet(table))[0]);
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot open " + table + ": " + e.getDetailMsg());
  }
}

PixelSeries TrackingData::load_pixel_track(int camera,
                                           int z_index,
                                           const std::string& tag) const {
  require_open();
  const int index = marker_positions.marker_index(z_index, tag);
  const int frames = num_frames(camera);
  PixelSeries series;
  if (frames == 0) {
    return series;
  }
  try {
    H5::DataSet dataset = file->openDataSet(camera_path(camera));
    const hsize_t count[3] = {static_cast<hsize_t>(frames), 1, 2};
    const hsize_t start[3] = {0, static_cast<hsize_t>(index), 0};
    H5::DataSpace file_space = dataset.getSpace();
    file_space.selectHyperslab(H5S_SELECT_SET, count, start);
    H5::DataSpace mem_space(3, count);
    std::vector<double> buffer(frames * 2);
    dataset.read(buffer.data(), H5::PredType::NATIVE_DOUBLE, mem_space,
                 file_space);
    series.reserve(frames);
    for (int f = 0; f < frames; f++) {
      const double x = buffer[2 * f];
      const double y = buffer[2 * f + 1];
      if (std::isnan(x) or std::isnan(y)) {
        series.push_back(std::nullopt);
      } else {
        series.push_back(Pt(x, y));
      }
    }
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot read pixel track of camera " +
                           std::to_string(camera) + " in " + path + ": " +
                           e.getDetailMsg());
  }
  return series;
}

std::vector<PixelSeries> TrackingData::load_pixel_tracks(int camera) const {
  require_open();
  std::vector<PixelSeries> tracks;
  if (num_frames(camera) == 0) {
    return tracks;
  }
  std::vector<hsize_t> dims;
  const std::vector<double> table =
      h5::read_doubles(*file, camera_path(camera), &dims);
  const size_t frames = dims[0];
  const size_t markers = dims[1];
  tracks.assign(markers, PixelSeries(frames));
  for (size_t f = 0; f < frames; f++) {
    for (size_t m = 0; m < markers; m++) {
      const double x = table[(f * markers + m) * 2];
      const double y = table[(f * markers + m) * 2 + 1];
      if (!std::isnan(x) and !std::isnan(y)) {
        tracks[m][f] = Pt(x, y);
      }
    }
  }
  return tracks;
}

void TrackingData::save_track(int z_index,
                              const std::string& tag,
                              const PointSeries& series) {
  require_open();
  marker_positions.marker_index(z_index, tag);
  std::vector<double> values(series.size() * 3, kUnknown);
  for (size_t t = 0; t < series.size(); t++) {
    if (series[t]) {
      values[3 * t] = series[t]->x();
      values[3 * t + 1] = series[t]->y();
      values[3 * t + 2] = series[t]->z();
    }
  }
  h5::write_doubles(*file, track_path(z_index, tag), values,
                    {series.size(), 3});
}

std::optional<PointSeries> TrackingData::load_track(
    int z_index,
    const std::string& tag) const {
  require_open();
  const std::string track = track_path(z_index, tag);
  if (!h5::exists(*file, track)) {
    return std::nullopt;
  }
  std::vector<hsize_t> dims;
  const std::vector<double> values = h5::read_doubles(*file, track, &dims);
  if (dims.size() != 2 or dims[1] != 3) {
    throw PreconditionError("track " + track + " in " + path +
                            " is not a [T, 3] array");
  }
  PointSeries series(dims[0]);
  for (size_t t = 0; t < dims[0]; t++) {
    const Eigen::Vector3d p(values[3 * t], values[3 * t + 1],
                            values[3 * t + 2]);
    if (!p.hasNaN()) {
      series[t] = p;
    }
  }
  return series;
}

bool TrackingData::has_timestamps() const {
  require_open();
  return h5::exists(*file, kTimestampsPath);
}

std::vector<double> TrackingData::timestamps() const {
  require_open();
  if (!has_timestamps()) {
    throw PreconditionError("no timestamps in " + path);
  }
  return h5::read_doubles(*file, kTimestampsPath);
}

void TrackingData::set_timestamps(const std::vector<double>& time) {
  require_open();
  h5::write_doubles(*file, kTimestampsPath, time, {time.size()});
}

}  // namespace ringtrack
