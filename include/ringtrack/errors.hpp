#pragma once

#include <stdexcept>
#include <string>

namespace ringtrack {

/**
 * @brief A structural precondition of a job or session does not hold: missing
 * file or video, start frame outside the video, unknown marker reference or a
 * marker layout that does not match the run file. Aborts the job/session.
 */
class PreconditionError : public std::runtime_error {
 public:
  explicit PreconditionError(const std::string& what)
      : std::runtime_error(what) {}
};

/**
 * @brief Opening, reading or writing the HDF5 backing store failed.
 */
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace ringtrack
