#include "ringtrack/cli.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <new>
#include <stdexcept>
#include <system_error>
#include <opencv2/core.hpp>
#include "../temp_dir.hpp"
#include "ringtrack/errors.hpp"
#include "ringtrack/tracking_data.hpp"

using namespace ringtrack;

TEST(RunGuardedTest, ReturnsTheCommandResult) {
  EXPECT_EQ(run_guarded([]() { return 0; }), 0);
  EXPECT_EQ(run_guarded([]() { return 3; }), 3);
}

TEST(RunGuardedTest, MapsErrorsToExitCodes) {
  int usage_calls = 0;
  const auto usage = [&usage_calls]() { usage_calls++; };

  EXPECT_EQ(run_guarded(
                []() -> int { throw PreconditionError("no video"); }, usage),
            2);
  EXPECT_EQ(usage_calls, 1);
  EXPECT_EQ(run_guarded(
                []() -> int { throw PersistenceError("disk full"); }, usage),
            1);
  EXPECT_EQ(run_guarded(
                []() -> int {
                  CV_Error(cv::Error::StsBadArg, "bad frame");
                  return 0;
                },
                usage),
            1);
  EXPECT_EQ(usage_calls, 1);
}

TEST(RunGuardedTest, ForeignExceptionsAreNotFatal) {
  EXPECT_EQ(run_guarded([]() -> int {
              throw std::filesystem::filesystem_error(
                  "cannot create", std::make_error_code(std::errc::io_error));
            }),
            1);
  EXPECT_EQ(run_guarded([]() -> int { throw std::bad_alloc(); }), 1);
  EXPECT_EQ(run_guarded([]() -> int { throw std::logic_error("bug"); }), 1);
}

TEST(RunGuardedTest, HistoryIsFlushedWhenACommandFails) {
  TempDir dir;
  const std::string path = dir.path("run.h5");
  const MarkerPositions markers(Eigen::Vector3d::Zero(),
                                Eigen::Matrix3d::Identity(), 1,
                                {{0, "R1", Eigen::Vector3d(0.01, 0, 0)}});
  TrackingData::initialize(path, markers)->close();

  const int code = run_guarded([&path]() -> int {
    std::unique_ptr<TrackingData> dataset = TrackingData::load(path);
    dataset->append(FlowQueue(Pt(10, 20), 0, 5, 1, 0, "R1"));
    throw std::runtime_error("interrupted");
  });
  EXPECT_EQ(code, 1);

  std::unique_ptr<TrackingData> reloaded = TrackingData::load(path);
  const std::vector<FlowQueue> history = reloaded->get_flow_queues(1);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].tag, "R1");
  EXPECT_EQ(history[0].end_frame, 5);
}
