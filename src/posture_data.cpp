#include "ringtrack/posture_data.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <memory>
#include "ringtrack/debug.hpp"
#include "ringtrack/errors.hpp"
#include "ringtrack/h5_io.hpp"

namespace ringtrack {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Relative singular value below which a reference direction is dropped.
constexpr double kRankTolerance = 1e-9;

const char* const kPostureGroup = "/posture";
const char* const kStagingGroup = "/posture.staging";

}  // namespace

const char* const PostureData::kPositionsPath = "/posture/positions";
const char* const PostureData::kDirectorsPath = "/posture/directors";
const char* const PostureData::kSampleCountPath = "/posture/sample_count";

PostureArrays::PostureArrays(int num_steps, int num_sections)
    : num_steps(num_steps),
      num_sections(num_sections),
      time(num_steps, kNaN),
      positions(static_cast<size_t>(num_steps) * 3 * num_sections, kNaN),
      directors(static_cast<size_t>(num_steps) * 9 * num_sections, kNaN),
      sample_count(static_cast<size_t>(num_steps) * num_sections, 0) {}

Eigen::Vector3d PostureArrays::center(int t, int z) const {
  return Eigen::Vector3d(position(t, 0, z), position(t, 1, z),
                         position(t, 2, z));
}

Eigen::Matrix3d PostureArrays::director_matrix(int t, int z) const {
  Eigen::Matrix3d d;
  for (int i = 0; i < 3; i++) {
    for (int j = 0; j < 3; j++) {
      d(i, j) = director(t, i, j, z);
    }
  }
  return d;
}

bool PostureArrays::is_degenerate(int t, int z) const {
  const int n = count(t, z);
  if (n < 0) {
    return std::isnan(position(t, 0, z));
  }
  if (n < kMinimumFitSamples) {
    return true;
  }
  // A collinear fit leaves the director singular.
  return std::abs(director_matrix(t, z).determinant()) <
         std::numeric_limits<double>::epsilon();
}

AffineFit fit_affine(const std::vector<Eigen::Vector3d>& R,
                     const std::vector<Eigen::Vector3d>& P) {
  if (R.empty() or R.size() != P.size()) {
    throw PreconditionError("affine fit needs as many observations as "
                            "reference positions (" +
                            std::to_string(R.size()) + " vs " +
                            std::to_string(P.size()) + ")");
  }
  const int n = static_cast<int>(R.size());

  Eigen::Vector3d r_mean = Eigen::Vector3d::Zero();
  Eigen::Vector3d p_mean = Eigen::Vector3d::Zero();
  for (int k = 0; k < n; k++) {
    r_mean += R[k];
    p_mean += P[k];
  }
  r_mean /= n;
  p_mean /= n;

  Eigen::MatrixXd Rc(n, 3);
  Eigen::MatrixXd Pc(n, 3);
  for (int k = 0; k < n; k++) {
    Rc.row(k) = (R[k] - r_mean).transpose();
    Pc.row(k) = (P[k] - p_mean).transpose();
  }

  AffineFit fit;
  fit.samples = n;

  Eigen::JacobiSVD<Eigen::MatrixXd> svd(Rc, Eigen::ComputeFullV);
  const Eigen::VectorXd sv = svd.singularValues();
  if (sv.size() == 0 or sv(0) <= 0.0) {
    // All references coincide: only the translation is known.
    fit.rank = 0;
    fit.b = p_mean - r_mean;
    return fit;
  }
  for (int k = 0; k < sv.size(); k++) {
    if (sv(k) > kRankTolerance * sv(0)) {
      fit.rank++;
    }
  }

  Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(Rc);
  cod.setThreshold(kRankTolerance);
  const Eigen::MatrixXd W = cod.solve(Pc);  // 3x3, Rc * W ~ Pc
  fit.A = W.transpose();

  if (fit.rank == 2) {
    const Eigen::Vector3d u = svd.matrixV().col(0);
    const Eigen::Vector3d v = svd.matrixV().col(1);
    const Eigen::Vector3d normal = u.cross(v);
    const Eigen::Vector3d Au = fit.A * u;
    const Eigen::Vector3d Av = fit.A * v;
    const double scale = 0.5 * (Au.norm() + Av.norm());
    Eigen::Vector3d An = Eigen::Vector3d::Zero();
    if (scale > 0.0) {
      An = Au.cross(Av) / scale;
    }
    fit.A += (An - fit.A * normal) * normal.transpose();
  }

  fit.b = p_mean - fit.A * r_mean;
  return fit;
}

PostureArrays compute_positions_and_directors(const TrackingData& dataset) {
  const MarkerPositions& markers = dataset.get_marker_positions();
  const std::vector<double> time = dataset.timestamps();
  const int T = static_cast<int>(time.size());
  const int N = markers.size();
  const Eigen::Vector3d& origin = markers.get_origin();
  const Eigen::Matrix3d Qt = markers.get_basis().transpose();

  PostureArrays arrays(T, N);
  arrays.time = time;

  RINGTRACK_LOG_INFO("computing posture of " << N << " cross-sections over "
                                             << T << " timesteps");

  for (int z = 0; z < N; z++) {
    std::vector<Eigen::Vector3d> reference;
    std::vector<PointSeries> tracks;
    for (const std::string& tag : markers.tags(z)) {
      std::optional<PointSeries> track = dataset.load_track(z, tag);
      if (!track) {
        RINGTRACK_LOG_DEBUG("no 3D track for z " << z << " tag " << tag);
        continue;
      }
      if (static_cast<int>(track->size()) != T) {
        throw PreconditionError(
            "3D track of z " + std::to_string(z) + " tag " + tag + " has " +
            std::to_string(track->size()) + " samples, timestamps have " +
            std::to_string(T));
      }
      reference.push_back(markers.get_position(z, tag));
      tracks.push_back(std::move(*track));
    }

    int degenerate_steps = 0;
    for (int t = 0; t < T; t++) {
      std::vector<Eigen::Vector3d> R;
      std::vector<Eigen::Vector3d> P;
      for (size_t k = 0; k < tracks.size(); k++) {
        if (tracks[k][t]) {
          R.push_back(reference[k]);
          P.push_back(*tracks[k][t]);
        }
      }
      arrays.count(t, z) = static_cast<int>(R.size());
      if (R.empty()) {
        degenerate_steps++;
        continue;
      }

      const AffineFit fit = fit_affine(R, P);
      if (fit.degenerate()) {
        degenerate_steps++;
        RINGTRACK_LOG_WARN("degenerate fit at z " << z << " t " << t << ": "
                                                  << fit.samples << " tags, "
                                                  << "reference rank "
                                                  << fit.rank);
      }

      const Eigen::Vector3d center = fit.A * origin + fit.b;
      const Eigen::Matrix3d director = fit.A * Qt;
      for (int i = 0; i < 3; i++) {
        arrays.position(t, i, z) = center(i);
        for (int j = 0; j < 3; j++) {
          arrays.director(t, i, j, z) = director(i, j);
        }
      }
    }
    if (degenerate_steps > 0) {
      RINGTRACK_LOG_INFO("z " << z << ": " << degenerate_steps << " of " << T
                              << " timesteps degenerate or unobserved");
    }
  }
  return arrays;
}

PostureData::PostureData(const std::string& path) : path(path) {
  if (!std::filesystem::exists(path)) {
    throw PreconditionError("run file not found: " + path);
  }
}

PostureData::~PostureData() {
  if (!unsaved) {
    return;
  }
  try {
    save_positions_and_directors();
  } catch (const std::exception& e) {
    RINGTRACK_LOG_ERROR("posture of " << path << " not saved: " << e.what());
  }
}

bool PostureData::read_cache() {
  std::unique_ptr<H5::H5File> file = h5::open_file(path, h5::Access::READ_ONLY);
  if (!h5::exists(*file, kPositionsPath) or
      !h5::exists(*file, kDirectorsPath)) {
    return false;
  }

  std::vector<hsize_t> pos_dims;
  std::vector<hsize_t> dir_dims;
  std::vector<double> positions =
      h5::read_doubles(*file, kPositionsPath, &pos_dims);
  std::vector<double> directors =
      h5::read_doubles(*file, kDirectorsPath, &dir_dims);
  if (pos_dims.size() != 3 or dir_dims.size() != 4 or pos_dims[1] != 3 or
      dir_dims[1] != 3 or dir_dims[2] != 3 or pos_dims[0] != dir_dims[0] or
      pos_dims[2] != dir_dims[3]) {
    RINGTRACK_LOG_WARN("posture arrays of " << path
                                            << " have inconsistent shapes, "
                                            << "recomputing");
    return false;
  }
  if (!h5::exists(*file, TrackingData::kTimestampsPath)) {
    throw PreconditionError("no timestamps in " + path);
  }

  const int T = static_cast<int>(pos_dims[0]);
  const int N = static_cast<int>(pos_dims[2]);
  PostureArrays cached(T, N);
  cached.positions = std::move(positions);
  cached.directors = std::move(directors);
  cached.time = h5::read_doubles(*file, TrackingData::kTimestampsPath);
  if (cached.time.size() != static_cast<size_t>(T)) {
    RINGTRACK_LOG_WARN("timestamps of " << path << " do not match the cached "
                                        << "posture, recomputing");
    return false;
  }
  std::vector<int> counts;
  if (h5::exists(*file, kSampleCountPath)) {
    counts = h5::read_ints(*file, kSampleCountPath);
  }
  if (counts.size() == cached.sample_count.size()) {
    cached.sample_count = std::move(counts);
  } else {
    if (!counts.empty()) {
      RINGTRACK_LOG_WARN("ignoring sample_count of "
                         << path << " with " << counts.size() << " entries");
    }
    std::fill(cached.sample_count.begin(), cached.sample_count.end(), -1);
  }
  arrays = std::move(cached);
  return true;
}

const PostureArrays& PostureData::load_positions_and_directors() {
  if (loaded) {
    return arrays;
  }
  if (read_cache()) {
    RINGTRACK_LOG_DEBUG("loaded posture from " << path);
    loaded = true;
    return arrays;
  }

  {
    std::unique_ptr<TrackingData> dataset = TrackingData::load(path);
    arrays = compute_positions_and_directors(*dataset);
    dataset->close();
  }
  loaded = true;
  unsaved = true;
  save_positions_and_directors();
  return arrays;
}

void PostureData::save_positions_and_directors() {
  require_loaded();
  const hsize_t T = arrays.num_steps;
  const hsize_t N = arrays.num_sections;
  const std::string staging = kStagingGroup;
  const std::string positions_staging = staging + "/positions";
  const std::string directors_staging = staging + "/directors";
  const std::string count_staging = staging + "/sample_count";

  std::unique_ptr<H5::H5File> file =
      h5::open_file(path, h5::Access::READ_WRITE);
  // Left over from an interrupted save.
  h5::remove(*file, staging);
  h5::write_doubles(*file, positions_staging, arrays.positions, {T, 3, N});
  h5::write_doubles(*file, directors_staging, arrays.directors, {T, 3, 3, N});
  h5::write_ints(*file, count_staging, arrays.sample_count, {T, N});
  h5::set_unit(*file, positions_staging, "m");
  h5::set_unit(*file, directors_staging, "m");

  // One link swap publishes all three arrays.
  h5::replace(*file, staging, kPostureGroup);
  try {
    file->close();
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot close " + path + ": " + e.getDetailMsg());
  }
  unsaved = false;
  RINGTRACK_LOG_INFO("saved posture to " << path);
}

void PostureData::invalidate() {
  std::unique_ptr<H5::H5File> file =
      h5::open_file(path, h5::Access::READ_WRITE);
  for (const char* dataset : {kPositionsPath, kDirectorsPath,
                              kSampleCountPath}) {
    if (h5::exists(*file, dataset)) {
      h5::remove(*file, dataset);
    }
  }
  arrays = PostureArrays();
  loaded = false;
  unsaved = false;
}

void PostureData::require_loaded() const {
  if (!loaded) {
    throw PreconditionError("posture of " + path + " not loaded");
  }
}

const std::vector<double>& PostureData::get_time() const {
  require_loaded();
  return arrays.time;
}

Eigen::Vector3d PostureData::get_cross_section_center_position(int t,
                                                               int z) const {
  require_loaded();
  if (t < 0 or t >= arrays.num_steps or z < 0 or z >= arrays.num_sections) {
    throw PreconditionError("posture index (" + std::to_string(t) + ", " +
                            std::to_string(z) + ") out of range");
  }
  return arrays.center(t, z);
}

Eigen::Matrix3d PostureData::get_cross_section_director(int t, int z) const {
  require_loaded();
  if (t < 0 or t >= arrays.num_steps or z < 0 or z >= arrays.num_sections) {
    throw PreconditionError("posture index (" + std::to_string(t) + ", " +
                            std::to_string(z) + ") out of range");
  }
  return arrays.director_matrix(t, z);
}

const PostureArrays& PostureData::get_arrays() const {
  require_loaded();
  return arrays;
}

}  // namespace ringtrack
