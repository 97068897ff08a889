#include "ringtrack/config.hpp"
#include "ringtrack/debug.hpp"
#include "ringtrack/errors.hpp"

namespace ringtrack {

namespace {

void read_if_present(const cv::FileNode& node, int& value) {
  if (!node.empty()) {
    value = static_cast<int>(node);
  }
}

void read_if_present(const cv::FileNode& node, double& value) {
  if (!node.empty()) {
    value = static_cast<double>(node);
  }
}

std::string require_string(const cv::FileNode& paths,
                           const std::string& key,
                           const std::string& file) {
  const cv::FileNode node = paths[key];
  if (node.empty() or !node.isString()) {
    throw PreconditionError("config " + file + ": missing paths." + key);
  }
  return static_cast<std::string>(node);
}

}  // namespace

FlowParams FlowParams::from_node(const cv::FileNode& node) {
  FlowParams params;
  if (node.empty()) {
    return params;
  }
  read_if_present(node["window_size"], params.window_size);
  read_if_present(node["max_level"], params.max_level);
  read_if_present(node["max_iterations"], params.max_iterations);
  read_if_present(node["epsilon"], params.epsilon);
  read_if_present(node["min_eig_threshold"], params.min_eig_threshold);

  if (params.window_size < 3 or params.max_level < 0 or
      params.max_iterations < 1 or params.epsilon <= 0) {
    throw PreconditionError("invalid flow parameters");
  }
  return params;
}

Config Config::load(const std::string& path) {
  cv::FileStorage fs;
  try {
    fs.open(path, cv::FileStorage::READ);
  } catch (const cv::Exception& e) {
    throw PreconditionError("cannot parse config " + path + ": " + e.what());
  }
  if (!fs.isOpened()) {
    throw PreconditionError("config file not found: " + path);
  }

  Config config;
  const cv::FileNode paths = fs["paths"];
  if (paths.empty()) {
    throw PreconditionError("config " + path + ": missing paths section");
  }
  config.footage_video_path = require_string(paths, "footage_video_path", path);
  config.tracing_data_path = require_string(paths, "tracing_data_path", path);
  config.marker_positions_path =
      require_string(paths, "marker_positions", path);
  if (!paths["postprocessing_path"].empty()) {
    config.postprocessing_path =
        static_cast<std::string>(paths["postprocessing_path"]);
  } else {
    config.postprocessing_path = ".";
  }
  config.flow = FlowParams::from_node(fs["flow"]);

  RINGTRACK_LOG_DEBUG("loaded config " << path);
  return config;
}

std::string Config::video_path(const std::string& tag, int cam, int run) const {
  return format_path(footage_video_path, {{"tag", tag},
                                          {"cam", std::to_string(cam)},
                                          {"run", std::to_string(run)}});
}

std::string Config::data_path(const std::string& tag, int run) const {
  return format_path(tracing_data_path,
                     {{"tag", tag}, {"run", std::to_string(run)}});
}

std::string Config::output_dir(const std::string& tag) const {
  return format_path(postprocessing_path, {{"tag", tag}});
}

std::string format_path(const std::string& pattern,
                        const std::map<std::string, std::string>& fields) {
  std::string out;
  out.reserve(pattern.size());
  size_t i = 0;
  while (i < pattern.size()) {
    if (pattern[i] != '{') {
      out += pattern[i++];
      continue;
    }
    const size_t close = pattern.find('}', i);
    if (close == std::string::npos) {
      throw PreconditionError("unterminated placeholder in " + pattern);
    }
    const std::string key = pattern.substr(i + 1, close - i - 1);
    const auto it = fields.find(key);
    if (it == fields.end()) {
      throw PreconditionError("unknown placeholder {" + key + "} in " +
                              pattern);
    }
    out += it->second;
    i = close + 1;
  }
  return out;
}

}  // namespace ringtrack
