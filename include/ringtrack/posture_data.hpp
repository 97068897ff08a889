#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "tracking_data.hpp"

namespace ringtrack {

// Fewest tags for a well-conditioned affine fit of one cross-section.
constexpr int kMinimumFitSamples = 4;

/**
 * @brief Posture time series of N cross-sections over T timesteps.
 *
 * Row-major storage: positions[T][3][N], directors[T][3][3][N] and
 * sample_count[T][N]. NaN marks a (timestep, cross-section) without any
 * observed tag. sample_count is -1 when it was not stored with the arrays.
 */
struct PostureArrays {
  int num_steps = 0;
  int num_sections = 0;
  std::vector<double> time;
  std::vector<double> positions;
  std::vector<double> directors;
  std::vector<int> sample_count;

  PostureArrays() = default;
  PostureArrays(int num_steps, int num_sections);

  double& position(int t, int i, int z) {
    return positions[(t * 3 + i) * num_sections + z];
  }
  double position(int t, int i, int z) const {
    return positions[(t * 3 + i) * num_sections + z];
  }
  double& director(int t, int i, int j, int z) {
    return directors[((t * 3 + i) * 3 + j) * num_sections + z];
  }
  double director(int t, int i, int j, int z) const {
    return directors[((t * 3 + i) * 3 + j) * num_sections + z];
  }
  int& count(int t, int z) { return sample_count[t * num_sections + z]; }
  int count(int t, int z) const { return sample_count[t * num_sections + z]; }

  Eigen::Vector3d center(int t, int z) const;
  Eigen::Matrix3d director_matrix(int t, int z) const;

  // Fewer than kMinimumFitSamples tags, or a collinear reference set.
  bool is_degenerate(int t, int z) const;
};

/**
 * @brief Least-squares fit of P ~ A * R + b.
 */
struct AffineFit {
  Eigen::Matrix3d A = Eigen::Matrix3d::Zero();
  Eigen::Vector3d b = Eigen::Vector3d::Zero();
  int samples = 0;
  int rank = 0;  // rank of the centered reference positions

  bool degenerate() const {
    return samples < kMinimumFitSamples or rank < 2;
  }
};

/**
 * @brief Fit the affine map taking reference positions R to observations P.
 *
 * The centered problem is solved with a complete orthogonal decomposition.
 * When the references span a plane (a ring), the column of A along the
 * plane normal n is completed as (A u x A v) / mean(|A u|, |A v|) for an
 * in-plane orthonormal pair u x v = n, so a rigid motion stays rigid.
 * Throws PreconditionError on empty or mismatched input.
 */
AffineFit fit_affine(const std::vector<Eigen::Vector3d>& R,
                     const std::vector<Eigen::Vector3d>& P);

/**
 * @brief Center and director of every cross-section at every timestep.
 *
 * T is the length of the run's timestamps. For cross-section z at time t the
 * tags of z with a known 3D position are fitted against their reference
 * positions; center = A * origin + b and director = A * Q^T (columns are
 * the transformed local axes).
 */
PostureArrays compute_positions_and_directors(const TrackingData& dataset);

/**
 * @brief Posture cache of one run file.
 *
 * load_positions_and_directors() reads /posture/{positions,directors} when
 * both exist and recomputes both otherwise. A recomputation that was not
 * saved explicitly is saved by the destructor.
 */
class PostureData {
 private:
  std::string path;
  PostureArrays arrays;
  bool loaded = false;
  bool unsaved = false;

  bool read_cache();
  void require_loaded() const;

 public:
  static const char* const kPositionsPath;
  static const char* const kDirectorsPath;
  static const char* const kSampleCountPath;

  // Throws PreconditionError if the run file does not exist.
  explicit PostureData(const std::string& path);
  ~PostureData();
  PostureData(const PostureData&) = delete;
  PostureData& operator=(const PostureData&) = delete;

  const PostureArrays& load_positions_and_directors();

  /**
   * @brief Write both arrays with unit "m". They are written with
   * sample_count into a staging group which then replaces /posture with a
   * single link move, so the file never holds one new and one old array.
   */
  void save_positions_and_directors();

  // Drop the cached arrays from the file and from memory.
  void invalidate();

  bool is_saved() const { return loaded and !unsaved; }

  const std::vector<double>& get_time() const;
  Eigen::Vector3d get_cross_section_center_position(int t, int z) const;
  Eigen::Matrix3d get_cross_section_director(int t, int z) const;
  const PostureArrays& get_arrays() const;
};

}  // namespace ringtrack
