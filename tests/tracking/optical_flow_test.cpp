#include "ringtrack/optical_flow.hpp"
#include <gtest/gtest.h>
#include "../temp_dir.hpp"
#include "ringtrack/errors.hpp"

using namespace ringtrack;

// Frames held in memory. `count` may exceed the frames actually available
// to simulate a truncated video.
class MemoryFrameSource : public FrameSource {
 private:
  std::vector<cv::Mat> frames;
  int count;
  int next = 0;

 public:
  int reads = 0;

  explicit MemoryFrameSource(std::vector<cv::Mat> frames, int count = -1)
      : frames(std::move(frames)), count(count) {
    if (this->count < 0) {
      this->count = static_cast<int>(this->frames.size());
    }
  }

  int frame_count() const override { return count; }
  double fps() const override { return 30.0; }
  cv::Size frame_size() const override { return frames.front().size(); }
  bool seek(int index) override {
    if (index < 0 or index >= static_cast<int>(frames.size())) {
      return false;
    }
    next = index;
    return true;
  }
  bool read(cv::Mat& frame) override {
    if (next >= static_cast<int>(frames.size())) {
      return false;
    }
    reads++;
    frame = frames[next++].clone();
    return true;
  }
  std::string name() const override { return "memory"; }
};

// Blurred bright disks at the given centers on a black BGR frame.
cv::Mat blob_frame(const std::vector<cv::Point2f>& centers) {
  cv::Mat frame(240, 320, CV_8UC3, cv::Scalar::all(0));
  for (const cv::Point2f& c : centers) {
    cv::circle(frame, c, 6, cv::Scalar::all(255), cv::FILLED, cv::LINE_AA);
  }
  cv::GaussianBlur(frame, frame, cv::Size(0, 0), 3.0);
  return frame;
}

class CameraOpticalFlowTest : public ::testing::Test {
 protected:
  TempDir dir;
  std::unique_ptr<TrackingData> dataset;

  void SetUp() override {
    const MarkerPositions markers(
        Eigen::Vector3d::Zero(), Eigen::Matrix3d::Identity(), 1,
        {{0, "R1", Eigen::Vector3d(0.01, 0, 0)},
         {0, "R2", Eigen::Vector3d(0, 0.01, 0)}});
    dataset = TrackingData::initialize(dir.path("run.h5"), markers);
  }
};

TEST_F(CameraOpticalFlowTest, TracksMovingBlob) {
  std::vector<cv::Mat> frames;
  for (int f = 0; f < 10; f++) {
    frames.push_back(blob_frame({cv::Point2f(100, 100 + 10 * f)}));
  }
  MemoryFrameSource source(frames);
  CameraOpticalFlow flow(source, *dataset, 0);
  EXPECT_EQ(flow.num_frames(), 10);

  dataset->append(FlowQueue(Pt(100, 100), 0, -1, 0, 0, "R1"));
  const std::vector<FlowResult> results = flow.run_pending();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_FALSE(results[0].skipped);
  EXPECT_FALSE(results[0].lost_frame);
  EXPECT_FALSE(results[0].batch_lost);
  EXPECT_EQ(results[0].frames_tracked, 10);

  const PixelSeries track = dataset->load_pixel_track(0, 0, "R1");
  ASSERT_EQ(track.size(), 10u);
  for (int f = 0; f < 10; f++) {
    ASSERT_TRUE(track[f]) << "frame " << f;
    EXPECT_TRUE(track[f]->in_radius(Pt(100, 100 + 10 * f), 1.0))
        << "frame " << f << " at " << track[f]->to_string();
  }
  EXPECT_TRUE(dataset->pending_flow_queues(0).empty());
  EXPECT_TRUE(dataset->get_flow_queues(0)[0].done);
}

TEST_F(CameraOpticalFlowTest, BatchSharesOnePass) {
  std::vector<cv::Mat> frames;
  for (int f = 0; f < 8; f++) {
    frames.push_back(blob_frame(
        {cv::Point2f(80 + 5 * f, 60), cv::Point2f(220, 180 - 5 * f)}));
  }
  MemoryFrameSource source(frames);
  CameraOpticalFlow flow(source, *dataset, 0);

  const std::vector<FlowResult> results =
      flow.run({FlowQueue(Pt(90, 60), 2, 7, 0, 0, "R1"),
                FlowQueue(Pt(220, 180), 0, 6, 0, 0, "R2")});
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].frames_tracked, 5);
  EXPECT_EQ(results[1].frames_tracked, 6);

  const PixelSeries r1 = dataset->load_pixel_track(0, 0, "R1");
  EXPECT_FALSE(r1[1]);
  EXPECT_EQ(*r1[2], Pt(90, 60));
  ASSERT_TRUE(r1[6]);
  EXPECT_TRUE(r1[6]->in_radius(Pt(110, 60), 1.0));
  EXPECT_FALSE(r1[7]);

  const PixelSeries r2 = dataset->load_pixel_track(0, 0, "R2");
  for (int f = 0; f < 6; f++) {
    ASSERT_TRUE(r2[f]);
    EXPECT_TRUE(r2[f]->in_radius(Pt(220, 180 - 5 * f), 1.0));
  }
  EXPECT_FALSE(r2[6]);
}

TEST_F(CameraOpticalFlowTest, LaterJobOverwritesEarlierOne) {
  std::vector<cv::Mat> frames(
      10, blob_frame({cv::Point2f(60, 60), cv::Point2f(200, 150)}));
  MemoryFrameSource source(frames);
  CameraOpticalFlow flow(source, *dataset, 0);

  // The second job moves R1 to the other blob from frame 5, the third moves
  // it back. The first and third share a frame range but must not be run
  // ahead of the second.
  const std::vector<FlowResult> results =
      flow.run({FlowQueue(Pt(60, 60), 0, -1, 0, 0, "R1"),
                FlowQueue(Pt(200, 150), 5, -1, 0, 0, "R1"),
                FlowQueue(Pt(60, 60), 0, -1, 0, 0, "R1")});
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].queue.start_frame, 0);
  EXPECT_EQ(results[1].queue.start_frame, 5);
  EXPECT_EQ(results[2].queue.start_frame, 0);

  const PixelSeries track = dataset->load_pixel_track(0, 0, "R1");
  for (int f = 5; f < 10; f++) {
    ASSERT_TRUE(track[f]) << "frame " << f;
    EXPECT_TRUE(track[f]->in_radius(Pt(60, 60), 1.0))
        << "frame " << f << " at " << track[f]->to_string();
  }
}

TEST_F(CameraOpticalFlowTest, StartAtFrameCountIsSkipped) {
  std::vector<cv::Mat> frames(5, blob_frame({cv::Point2f(50, 50)}));
  MemoryFrameSource source(frames);
  CameraOpticalFlow flow(source, *dataset, 0);

  dataset->append(FlowQueue(Pt(50, 50), 5, -1, 0, 0, "R1"));
  const std::vector<FlowResult> results = flow.run_pending();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].skipped);
  EXPECT_EQ(results[0].frames_tracked, 0);
  EXPECT_EQ(dataset->num_frames(0), 0);
  EXPECT_EQ(source.reads, 0);
  EXPECT_EQ(dataset->pending_flow_queues(0).size(), 1u);
}

TEST_F(CameraOpticalFlowTest, TotalLossStopsEarly) {
  std::vector<cv::Mat> frames;
  for (int f = 0; f < 20; f++) {
    frames.push_back(f < 3 ? blob_frame({cv::Point2f(100, 100)})
                           : cv::Mat(240, 320, CV_8UC3, cv::Scalar::all(0)));
  }
  MemoryFrameSource source(frames);
  CameraOpticalFlow flow(source, *dataset, 0);

  const std::vector<FlowResult> results =
      flow.run({FlowQueue(Pt(100, 100), 0, -1, 0, 0, "R1")});
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].batch_lost);
  ASSERT_TRUE(results[0].lost_frame);
  EXPECT_LE(*results[0].lost_frame, 4);
  EXPECT_LT(source.reads, 10);

  const PixelSeries track = dataset->load_pixel_track(0, 0, "R1");
  ASSERT_EQ(track.size(), 20u);
  for (int f = 0; f < 3; f++) {
    EXPECT_TRUE(track[f]) << "frame " << f;
  }
  for (int f = *results[0].lost_frame; f < 20; f++) {
    EXPECT_FALSE(track[f]) << "frame " << f;
  }
}

TEST_F(CameraOpticalFlowTest, TruncatedVideoKeepsTrackedFrames) {
  std::vector<cv::Mat> frames(10, blob_frame({cv::Point2f(60, 60)}));
  MemoryFrameSource source(frames, 20);
  CameraOpticalFlow flow(source, *dataset, 0);

  const std::vector<FlowResult> results =
      flow.run({FlowQueue(Pt(60, 60), 0, -1, 0, 0, "R2")});
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].read_failed);
  EXPECT_EQ(results[0].frames_tracked, 10);

  const PixelSeries track = dataset->load_pixel_track(0, 0, "R2");
  ASSERT_EQ(track.size(), 20u);
  EXPECT_TRUE(track[9]);
  EXPECT_FALSE(track[10]);
}

TEST_F(CameraOpticalFlowTest, RejectsForeignJobs) {
  std::vector<cv::Mat> frames(3, blob_frame({cv::Point2f(60, 60)}));
  MemoryFrameSource source(frames);
  CameraOpticalFlow flow(source, *dataset, 0);

  EXPECT_THROW(flow.run({FlowQueue(Pt(60, 60), 0, -1, 1, 0, "R1")}),
               PreconditionError);
  EXPECT_THROW(flow.run({FlowQueue(Pt(60, 60), 0, -1, 0, 0, "R3")}),
               PreconditionError);
  EXPECT_EQ(source.reads, 0);
}

TEST_F(CameraOpticalFlowTest, PointInfoAfterLoss) {
  std::vector<cv::Mat> frames;
  for (int f = 0; f < 12; f++) {
    frames.push_back(f < 6 ? blob_frame({cv::Point2f(100 + 4 * f, 120)})
                           : cv::Mat(240, 320, CV_8UC3, cv::Scalar::all(0)));
  }
  MemoryFrameSource source(frames);
  CameraOpticalFlow flow(source, *dataset, 0);
  const std::vector<FlowResult> results =
      flow.run({FlowQueue(Pt(100, 120), 0, -1, 0, 0, "R1")});
  ASSERT_TRUE(results[0].lost_frame);

  const PointInfo info = flow.get_point_info(0, "R1", 11);
  EXPECT_TRUE(info.is_lost);
  ASSERT_TRUE(info.last_frame);
  EXPECT_GE(*info.last_frame, 5);
  EXPECT_LT(*info.last_frame, 11);
  ASSERT_TRUE(info.predicted_point);
  EXPECT_GT(info.predicted_point->x, 100);
}
