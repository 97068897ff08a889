#include "ringtrack/frame_source.hpp"
#include <filesystem>
#include "ringtrack/debug.hpp"
#include "ringtrack/errors.hpp"

namespace ringtrack {

VideoFrameSource::VideoFrameSource(const std::string& video_path)
    : path(video_path) {
  if (!std::filesystem::exists(path)) {
    throw PreconditionError("video not found: " + path);
  }
  cap.open(path);
  if (!cap.isOpened()) {
    throw PreconditionError("video is not properly opened: " + path);
  }
  count = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
  rate = cap.get(cv::CAP_PROP_FPS);
  size = cv::Size(static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
                  static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)));
  RINGTRACK_LOG_DEBUG("opened " << path << ": " << count << " frames, "
                                << size.width << "x" << size.height << " @ "
                                << rate << " fps");
}

VideoFrameSource::~VideoFrameSource() {
  if (cap.isOpened()) {
    cap.release();
  }
}

bool VideoFrameSource::seek(int index) {
  if (index < 0 or index >= count) {
    return false;
  }
  return cap.set(cv::CAP_PROP_POS_FRAMES, index);
}

bool VideoFrameSource::read(cv::Mat& frame) {
  if (!cap.read(frame)) {
    return false;
  }
  return !frame.empty();
}

cv::Mat flat_color(const cv::Mat& frame) {
  cv::Mat gray;
  if (frame.channels() == 1) {
    gray = frame.clone();
  } else if (frame.channels() == 4) {
    cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
  } else {
    cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
  }
  return gray;
}

}  // namespace ringtrack
