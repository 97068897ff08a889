#pragma once

#include <H5Cpp.h>
#include <memory>
#include <string>
#include <vector>

namespace ringtrack {
namespace h5 {

enum class Access { READ_ONLY, READ_WRITE };

/**
 * @brief Open an existing HDF5 file. A missing file is a PreconditionError,
 * any HDF5 failure a PersistenceError.
 */
std::unique_ptr<H5::H5File> open_file(const std::string& path, Access access);

/**
 * @brief Create (truncate) a file, creating its parent directories.
 */
std::unique_ptr<H5::H5File> create_file(const std::string& path);

// True if every component of an absolute path ("/a/b/c") exists.
bool exists(const H5::H5File& file, const std::string& path);

H5::Group require_group(H5::H5File& file, const std::string& path);

void remove(H5::H5File& file, const std::string& path);

/**
 * @brief Move src over dst, removing dst first when present.
 */
void replace(H5::H5File& file, const std::string& src, const std::string& dst);

// Row-major double / int arrays. Existing datasets are replaced.
void write_doubles(H5::H5File& file,
                   const std::string& path,
                   const std::vector<double>& values,
                   const std::vector<hsize_t>& dims);
void write_ints(H5::H5File& file,
                const std::string& path,
                const std::vector<int>& values,
                const std::vector<hsize_t>& dims);
void write_strings(H5::H5File& file,
                   const std::string& path,
                   const std::vector<std::string>& values);

std::vector<double> read_doubles(const H5::H5File& file,
                                 const std::string& path,
                                 std::vector<hsize_t>* dims = nullptr);
std::vector<int> read_ints(const H5::H5File& file,
                           const std::string& path,
                           std::vector<hsize_t>* dims = nullptr);
std::vector<std::string> read_strings(const H5::H5File& file,
                                      const std::string& path);

std::vector<hsize_t> shape(const H5::DataSet& dataset);

void set_unit(H5::H5File& file, const std::string& path,
              const std::string& unit);
std::string get_unit(const H5::H5File& file, const std::string& path);

// Fixed-length string type used for tags.
H5::StrType tag_type();

constexpr size_t kTagLength = 32;

}  // namespace h5
}  // namespace ringtrack
