#include "ringtrack/labeling.hpp"
#include <gtest/gtest.h>
#include "../temp_dir.hpp"
#include "ringtrack/errors.hpp"

using namespace ringtrack;

class LabelingSessionTest : public ::testing::Test {
 protected:
  MarkerPositions markers{Eigen::Vector3d::Zero(), Eigen::Matrix3d::Identity(),
                          2,
                          {{0, "R1", Eigen::Vector3d(0.01, 0, 0)},
                           {0, "R2", Eigen::Vector3d(0, 0.01, 0)},
                           {1, "R1", Eigen::Vector3d(0.01, 0, 0)},
                           {1, "R2", Eigen::Vector3d(0, 0.01, 0)}}};
};

TEST_F(LabelingSessionTest, ReusesPreviousTag) {
  LabelingSession session(markers);
  EXPECT_FALSE(session.get_previous_tag());

  const FlowQueue first = session.make_seed(Pt(10, 10), 0, -1, 1, 0, "R2");
  const FlowQueue second = session.make_seed(Pt(12, 40), 0, -1, 1, 1);
  EXPECT_EQ(first.tag, "R2");
  EXPECT_EQ(second.tag, "R2");
  EXPECT_EQ(second.z_index, 1);
  EXPECT_EQ(*session.get_previous_tag(), "R2");

  session.make_seed(Pt(12, 40), 0, -1, 1, 1, "R1");
  EXPECT_EQ(*session.get_previous_tag(), "R1");
}

TEST_F(LabelingSessionTest, SessionsAreIndependent) {
  LabelingSession a(markers);
  LabelingSession b(markers);
  a.make_seed(Pt(1, 1), 0, -1, 0, 0, "R1");
  EXPECT_THROW(b.make_seed(Pt(1, 1), 0, -1, 0, 0), PreconditionError);
}

TEST_F(LabelingSessionTest, RejectsUnknownMarker) {
  LabelingSession session(markers);
  EXPECT_THROW(session.make_seed(Pt(1, 1), 0, -1, 0, 0, "R5"),
               PreconditionError);
  EXPECT_THROW(session.make_seed(Pt(1, 1), 0, -1, 0, 2, "R1"),
               PreconditionError);
  EXPECT_FALSE(session.get_previous_tag());
}

TEST_F(LabelingSessionTest, ReadsSeedFile) {
  TempDir dir;
  const std::string file = dir.write(
      "seeds.yaml",
      "%YAML:1.0\n"
      "seeds:\n"
      "  - { point: [412.5, 220.], start_frame: 0, end_frame: 100, camera: 1, "
      "z_index: 0, tag: R1 }\n"
      "  - { point: [430., 221.], start_frame: 0, camera: 1, z_index: 1 }\n"
      "  - { point: [100., 50.], start_frame: 20, camera: 2, z_index: 0, "
      "tag: R2 }\n");

  LabelingSession session(markers);
  const std::vector<FlowQueue> seeds = session.read_seeds(file);
  ASSERT_EQ(seeds.size(), 3u);
  EXPECT_EQ(seeds[0].point, Pt(412.5, 220.));
  EXPECT_EQ(seeds[0].end_frame, 100);
  EXPECT_EQ(seeds[1].tag, "R1");
  EXPECT_EQ(seeds[1].end_frame, -1);
  EXPECT_EQ(seeds[1].z_index, 1);
  EXPECT_EQ(seeds[2].camera, 2);
  EXPECT_EQ(seeds[2].start_frame, 20);
  EXPECT_FALSE(seeds[2].done);
}

TEST_F(LabelingSessionTest, MalformedSeedFile) {
  TempDir dir;
  LabelingSession session(markers);
  EXPECT_THROW(session.read_seeds(dir.path("absent.yaml")), PreconditionError);
  EXPECT_THROW(
      session.read_seeds(dir.write("seeds.yaml",
                                   "%YAML:1.0\n"
                                   "seeds:\n"
                                   "  - { point: [1.], start_frame: 0, "
                                   "camera: 0, z_index: 0, tag: R1 }\n")),
      PreconditionError);
}
