#pragma once

#include <opencv2/opencv.hpp>
#include <string>

namespace ringtrack {

/**
 * @brief Frame-indexable image sequence of one camera.
 */
class FrameSource {
 public:
  virtual ~FrameSource() = default;

  virtual int frame_count() const = 0;
  virtual double fps() const = 0;
  virtual cv::Size frame_size() const = 0;

  // Position the source so the next read() returns frame `index`.
  virtual bool seek(int index) = 0;

  // Read the next frame. Returns false at the end of the stream or on error.
  virtual bool read(cv::Mat& frame) = 0;

  virtual std::string name() const = 0;
};

/**
 * @brief Recorded footage decoded with cv::VideoCapture.
 */
class VideoFrameSource : public FrameSource {
 private:
  std::string path;
  cv::VideoCapture cap;
  int count;
  double rate;
  cv::Size size;

 public:
  // Throws PreconditionError if the video is missing or cannot be decoded.
  explicit VideoFrameSource(const std::string& video_path);
  ~VideoFrameSource() override;

  int frame_count() const override { return count; }
  double fps() const override { return rate; }
  cv::Size frame_size() const override { return size; }
  bool seek(int index) override;
  bool read(cv::Mat& frame) override;
  std::string name() const override { return path; }
};

/**
 * @brief Single-channel intensity image used by the optical flow.
 */
cv::Mat flat_color(const cv::Mat& frame);

}  // namespace ringtrack
