#include "ringtrack/h5_io.hpp"
#include <cstring>
#include <filesystem>
#include "ringtrack/errors.hpp"

namespace ringtrack {
namespace h5 {

namespace {

std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> parts;
  std::string current;
  for (char c : path) {
    if (c == '/') {
      if (!current.empty()) {
        parts.push_back(current);
      }
      current.clear();
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    parts.push_back(current);
  }
  return parts;
}

std::string parent_of(const std::string& path) {
  const size_t pos = path.find_last_of('/');
  if (pos == std::string::npos or pos == 0) {
    return "/";
  }
  return path.substr(0, pos);
}

template <typename T>
void write_array(H5::H5File& file,
                 const std::string& path,
                 const T* values,
                 size_t count,
                 const std::vector<hsize_t>& dims,
                 const H5::PredType& type) {
  hsize_t total = 1;
  for (hsize_t d : dims) {
    total *= d;
  }
  if (total != count) {
    throw PersistenceError("dataset " + path + ": shape does not match " +
                           std::to_string(count) + " values");
  }
  try {
    if (exists(file, path)) {
      file.unlink(path);
    }
    require_group(file, parent_of(path));
    H5::DataSpace space(static_cast<int>(dims.size()), dims.data());
    H5::DataSet dataset = file.createDataSet(path, type, space);
    if (count > 0) {
      dataset.write(values, type);
    }
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot write " + path + " in " +
                           file.getFileName() + ": " + e.getDetailMsg());
  }
}

template <typename T>
std::vector<T> read_array(const H5::H5File& file,
                          const std::string& path,
                          std::vector<hsize_t>* dims,
                          const H5::PredType& type) {
  if (!exists(file, path)) {
    throw PreconditionError("dataset " + path + " not found in " +
                            file.getFileName());
  }
  try {
    H5::DataSet dataset = file.openDataSet(path);
    std::vector<hsize_t> extent = shape(dataset);
    hsize_t total = 1;
    for (hsize_t d : extent) {
      total *= d;
    }
    std::vector<T> values(total);
    if (total > 0) {
      dataset.read(values.data(), type);
    }
    if (dims != nullptr) {
      *dims = extent;
    }
    return values;
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot read " + path + " in " +
                           file.getFileName() + ": " + e.getDetailMsg());
  }
}

}  // namespace

std::unique_ptr<H5::H5File> open_file(const std::string& path, Access access) {
  if (!std::filesystem::exists(path)) {
    throw PreconditionError("file does not exist: " + path);
  }
  H5::Exception::dontPrint();
  try {
    const unsigned flags =
        access == Access::READ_ONLY ? H5F_ACC_RDONLY : H5F_ACC_RDWR;
    return std::make_unique<H5::H5File>(path, flags);
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot open " + path + ": " + e.getDetailMsg());
  }
}

std::unique_ptr<H5::H5File> create_file(const std::string& path) {
  H5::Exception::dontPrint();
  const std::filesystem::path parent =
      std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw PersistenceError("cannot create directory " + parent.string() +
                             ": " + ec.message());
    }
  }
  try {
    return std::make_unique<H5::H5File>(path, H5F_ACC_TRUNC);
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot create " + path + ": " + e.getDetailMsg());
  }
}

bool exists(const H5::H5File& file, const std::string& path) {
  std::string current;
  try {
    for (const std::string& part : split_path(path)) {
      current += "/" + part;
      if (!file.nameExists(current)) {
        return false;
      }
    }
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot look up " + current + ": " +
                           e.getDetailMsg());
  }
  return true;
}

H5::Group require_group(H5::H5File& file, const std::string& path) {
  try {
    std::string current;
    for (const std::string& part : split_path(path)) {
      current += "/" + part;
      if (!file.nameExists(current)) {
        file.createGroup(current);
      }
    }
    return file.openGroup(current.empty() ? "/" : current);
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot create group " + path + ": " +
                           e.getDetailMsg());
  }
}

void remove(H5::H5File& file, const std::string& path) {
  if (!exists(file, path)) {
    return;
  }
  try {
    file.unlink(path);
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot remove " + path + ": " + e.getDetailMsg());
  }
}

void replace(H5::H5File& file, const std::string& src, const std::string& dst) {
  try {
    if (exists(file, dst)) {
      file.unlink(dst);
    }
    file.moveLink(src, dst);
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot move " + src + " to " + dst + ": " +
                           e.getDetailMsg());
  }
}

void write_doubles(H5::H5File& file,
                   const std::string& path,
                   const std::vector<double>& values,
                   const std::vector<hsize_t>& dims) {
  write_array(file, path, values.data(), values.size(), dims,
              H5::PredType::NATIVE_DOUBLE);
}

void write_ints(H5::H5File& file,
                const std::string& path,
                const std::vector<int>& values,
                const std::vector<hsize_t>& dims) {
  write_array(file, path, values.data(), values.size(), dims,
              H5::PredType::NATIVE_INT);
}

void write_strings(H5::H5File& file,
                   const std::string& path,
                   const std::vector<std::string>& values) {
  std::vector<char> buffer(values.size() * kTagLength, '\0');
  for (size_t i = 0; i < values.size(); i++) {
    if (values[i].size() >= kTagLength) {
      throw PersistenceError("string too long for " + path + ": " + values[i]);
    }
    std::memcpy(&buffer[i * kTagLength], values[i].data(), values[i].size());
  }
  try {
    if (exists(file, path)) {
      file.unlink(path);
    }
    require_group(file, parent_of(path));
    const hsize_t dims[1] = {values.size()};
    H5::DataSpace space(1, dims);
    H5::DataSet dataset = file.createDataSet(path, tag_type(), space);
    if (!values.empty()) {
      dataset.write(buffer.data(), tag_type());
    }
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot write " + path + ": " + e.getDetailMsg());
  }
}

std::vector<double> read_doubles(const H5::H5File& file,
                                 const std::string& path,
                                 std::vector<hsize_t>* dims) {
  return read_array<double>(file, path, dims, H5::PredType::NATIVE_DOUBLE);
}

std::vector<int> read_ints(const H5::H5File& file,
                           const std::string& path,
                           std::vector<hsize_t>* dims) {
  return read_array<int>(file, path, dims, H5::PredType::NATIVE_INT);
}

std::vector<std::string> read_strings(const H5::H5File& file,
                                      const std::string& path) {
  if (!exists(file, path)) {
    throw PreconditionError("dataset " + path + " not found in " +
                            file.getFileName());
  }
  try {
    H5::DataSet dataset = file.openDataSet(path);
    const std::vector<hsize_t> extent = shape(dataset);
    const size_t count = extent.empty() ? 0 : extent[0];
    std::vector<char> buffer(count * kTagLength, '\0');
    if (count > 0) {
      dataset.read(buffer.data(), tag_type());
    }
    std::vector<std::string> values;
    for (size_t i = 0; i < count; i++) {
      const char* begin = &buffer[i * kTagLength];
      values.emplace_back(begin, strnlen(begin, kTagLength));
    }
    return values;
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot read " + path + ": " + e.getDetailMsg());
  }
}

std::vector<hsize_t> shape(const H5::DataSet& dataset) {
  H5::DataSpace space = dataset.getSpace();
  const int rank = space.getSimpleExtentNdims();
  std::vector<hsize_t> dims(rank);
  if (rank > 0) {
    space.getSimpleExtentDims(dims.data());
  }
  return dims;
}

void set_unit(H5::H5File& file, const std::string& path,
              const std::string& unit) {
  try {
    H5::DataSet dataset = file.openDataSet(path);
    if (dataset.attrExists("unit")) {
      dataset.removeAttr("unit");
    }
    H5::StrType type(H5::PredType::C_S1, unit.size() + 1);
    H5::Attribute attr =
        dataset.createAttribute("unit", type, H5::DataSpace(H5S_SCALAR));
    attr.write(type, unit.c_str());
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot set unit of " + path + ": " +
                           e.getDetailMsg());
  }
}

std::string get_unit(const H5::H5File& file, const std::string& path) {
  try {
    H5::DataSet dataset = file.openDataSet(path);
    if (!dataset.attrExists("unit")) {
      return "";
    }
    H5::Attribute attr = dataset.openAttribute("unit");
    H5::StrType type = attr.getStrType();
    std::string unit;
    attr.read(type, unit);
    return unit;
  } catch (const H5::Exception& e) {
    throw PersistenceError("cannot read unit of " + path + ": " +
                           e.getDetailMsg());
  }
}

H5::StrType tag_type() {
  H5::StrType type(H5::PredType::C_S1, kTagLength);
  type.setStrpad(H5T_STR_NULLTERM);
  return type;
}

}  // namespace h5
}  // namespace ringtrack
