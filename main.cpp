#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "ringtrack/cli.hpp"
#include "ringtrack/config.hpp"
#include "ringtrack/debug.hpp"
#include "ringtrack/errors.hpp"
#include "ringtrack/frame_source.hpp"
#include "ringtrack/labeling.hpp"
#include "ringtrack/marker_positions.hpp"
#include "ringtrack/optical_flow.hpp"
#include "ringtrack/posture_data.hpp"
#include "ringtrack/tracking_data.hpp"

using namespace ringtrack;

struct Options {
  std::string config_path;
  std::string command;
  std::string tag;
  int run = 1;
  int camera = -1;
  int frame = -1;
  int end_frame = -1;
  int z_index = -1;
  std::string marker;
  std::optional<Pt> point;
  std::string seeds_path;
  bool force = false;
  bool verbose = false;
};

void print_usage(void) {
  std::cout
      << "usage: ringtrack <config.yaml> <command> [options]" << std::endl
      << "commands:" << std::endl
      << "  init       create the run file, -i seeds.yaml appends seeds"
      << std::endl
      << "  track      run the pending flow queues (-c cam, all by default)"
      << std::endl
      << "  queues     list the flow queue history (-c cam, -s frame)"
      << std::endl
      << "  posture    load or compute the posture (-f recomputes)"
      << std::endl
      << "  reacquire  point info of -z z -m marker at -s frame on -c cam,"
      << std::endl
      << "             -p x,y appends a continuation (-e end frame)"
      << std::endl
      << "  render     write the tracking overlay video of -c cam" << std::endl
      << "options: -t tag  -r run  -v verbose" << std::endl;
}

Pt parse_point(const std::string& text) {
  const size_t comma = text.find(',');
  if (comma == std::string::npos) {
    throw PreconditionError("point must be x,y: " + text);
  }
  return Pt(std::stod(text.substr(0, comma)),
            std::stod(text.substr(comma + 1)));
}

Options parse_args(int argc, char** argv) {
  if (argc < 3) {
    throw PreconditionError("missing config file or command");
  }
  Options options;
  options.config_path = argv[1];
  options.command = argv[2];

  for (int i = 3; i < argc; i++) {
    const std::string flag = argv[i];
    if (flag == "-v") {
      options.verbose = true;
      continue;
    } else if (flag == "-f") {
      options.force = true;
      continue;
    }
    if (i + 1 >= argc) {
      throw PreconditionError("option " + flag + " needs a value");
    }
    const std::string value = argv[++i];
    try {
      if (flag == "-t") {
        options.tag = value;
      } else if (flag == "-r") {
        options.run = std::stoi(value);
      } else if (flag == "-c") {
        options.camera = std::stoi(value);
      } else if (flag == "-s") {
        options.frame = std::stoi(value);
      } else if (flag == "-e") {
        options.end_frame = std::stoi(value);
      } else if (flag == "-z") {
        options.z_index = std::stoi(value);
      } else if (flag == "-m") {
        options.marker = value;
      } else if (flag == "-p") {
        options.point = parse_point(value);
      } else if (flag == "-i") {
        options.seeds_path = value;
      } else {
        throw PreconditionError("unknown option " + flag);
      }
    } catch (const std::logic_error&) {
      // std::stoi / std::stod reject the value
      throw PreconditionError("invalid value for " + flag + ": " + value);
    }
  }
  return options;
}

void require_camera(const Options& options) {
  if (options.camera < 0) {
    throw PreconditionError(options.command + " needs a camera (-c)");
  }
}

int cmd_init(const Config& config, const Options& options) {
  const MarkerPositions marker_positions =
      MarkerPositions::from_yaml(config.marker_positions_path);
  std::unique_ptr<TrackingData> dataset = TrackingData::initialize(
      config.data_path(options.tag, options.run), marker_positions);
  if (!options.seeds_path.empty()) {
    LabelingSession session(dataset->get_marker_positions());
    for (const FlowQueue& queue : session.read_seeds(options.seeds_path)) {
      dataset->append(queue);
    }
  }
  dataset->close();
  return 0;
}

int cmd_track(const Config& config, const Options& options) {
  std::unique_ptr<TrackingData> dataset =
      TrackingData::load(config.data_path(options.tag, options.run));

  std::set<int> cameras;
  if (options.camera >= 0) {
    cameras.insert(options.camera);
  } else {
    for (const FlowQueue& queue : dataset->get_flow_queues()) {
      if (!queue.done) {
        cameras.insert(queue.camera);
      }
    }
  }
  if (cameras.empty()) {
    RINGTRACK_LOG_INFO("no pending flow queues");
  }

  for (int cam : cameras) {
    VideoFrameSource source(config.video_path(options.tag, cam, options.run));
    CameraOpticalFlow flow(source, *dataset, cam, config.flow);
    for (const FlowResult& result : flow.run_pending()) {
      if (result.skipped) {
        continue;
      }
      std::cout << result.queue.to_string() << ": " << result.frames_tracked
                << " frames";
      if (result.lost_frame) {
        std::cout << ", lost at " << *result.lost_frame;
      }
      if (result.read_failed) {
        std::cout << ", video ended early";
      }
      std::cout << std::endl;
    }
  }
  dataset->close();
  return 0;
}

int cmd_queues(const Config& config, const Options& options) {
  std::unique_ptr<TrackingData> dataset =
      TrackingData::load(config.data_path(options.tag, options.run));
  for (const FlowQueue& queue :
       dataset->get_flow_queues(options.camera, options.frame)) {
    std::cout << (queue.done ? "[done]    " : "[pending] ") << queue.to_string()
              << std::endl;
  }
  dataset->close();
  return 0;
}

int cmd_posture(const Config& config, const Options& options) {
  PostureData posture(config.data_path(options.tag, options.run));
  if (options.force) {
    posture.invalidate();
  }
  const PostureArrays& arrays = posture.load_positions_and_directors();

  int degenerate = 0;
  for (int t = 0; t < arrays.num_steps; t++) {
    for (int z = 0; z < arrays.num_sections; z++) {
      if (arrays.is_degenerate(t, z)) {
        degenerate++;
      }
    }
  }
  std::cout << arrays.num_sections << " cross-sections, " << arrays.num_steps
            << " timesteps, " << degenerate << " degenerate samples"
            << std::endl;
  return 0;
}

int cmd_reacquire(const Config& config, const Options& options) {
  require_camera(options);
  if (options.z_index < 0 or options.marker.empty() or options.frame < 0) {
    throw PreconditionError("reacquire needs -z, -m and -s");
  }
  std::unique_ptr<TrackingData> dataset =
      TrackingData::load(config.data_path(options.tag, options.run));
  ReappearanceModule reappearance;
  const PointInfo info = reappearance.get_point_info(
      *dataset, options.camera, options.z_index, options.marker, options.frame);

  std::cout << "z " << info.z_index << " tag " << info.tag << " frame "
            << info.frame << (info.is_lost ? ": lost" : ": tracked")
            << std::endl;
  if (info.last_frame) {
    std::cout << "last known " << info.point->to_string() << " at frame "
              << *info.last_frame << std::endl;
  }
  if (info.predicted_point) {
    std::cout << "predicted " << info.predicted_point->to_string()
              << std::endl;
  }

  if (options.point) {
    const FlowQueue queue = ReappearanceModule::make_continuation(
        info, *options.point, options.end_frame);
    dataset->append(queue);
    std::cout << "appended " << queue.to_string() << std::endl;
  }
  dataset->close();
  return 0;
}

int cmd_render(const Config& config, const Options& options) {
  require_camera(options);
  std::unique_ptr<TrackingData> dataset =
      TrackingData::load(config.data_path(options.tag, options.run));
  VideoFrameSource source(
      config.video_path(options.tag, options.camera, options.run));
  CameraOpticalFlow flow(source, *dataset, options.camera, config.flow);

  const std::filesystem::path out =
      std::filesystem::path(config.output_dir(options.tag)) /
      ("tracking-cam" + std::to_string(options.camera) + "-run" +
       std::to_string(options.run) + ".mp4");
  flow.render_tracking_video(out.string());
  dataset->close();
  return 0;
}

int main(int argc, char** argv) {
  const auto usage_on_error = [argc]() {
    if (argc < 3) {
      print_usage();
    }
  };
  return run_guarded([argc, argv]() {
    const Options options = parse_args(argc, argv);
    if (options.verbose) {
      Logger::set_level(LogLevel::DEBUG);
    }
    const Config config = Config::load(options.config_path);

    if (options.command == "init") {
      return cmd_init(config, options);
    } else if (options.command == "track") {
      return cmd_track(config, options);
    } else if (options.command == "queues") {
      return cmd_queues(config, options);
    } else if (options.command == "posture") {
      return cmd_posture(config, options);
    } else if (options.command == "reacquire") {
      return cmd_reacquire(config, options);
    } else if (options.command == "render") {
      return cmd_render(config, options);
    }
    print_usage();
    return 2;
  }, usage_on_error);
}
