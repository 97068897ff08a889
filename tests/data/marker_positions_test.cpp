#include "ringtrack/marker_positions.hpp"
#include <gtest/gtest.h>
#include "../temp_dir.hpp"
#include "ringtrack/errors.hpp"

using namespace ringtrack;

namespace {

const char* const kSharedRing =
    "%YAML:1.0\n"
    "origin: [0., 0., 0.]\n"
    "basis: [1., 0., 0., 0., 1., 0., 0., 0., 1.]\n"
    "num_cross_sections: 3\n"
    "ring:\n"
    "  - { tag: R1, position: [0.01, 0., 0.] }\n"
    "  - { tag: R2, position: [0., 0.01, 0.] }\n"
    "  - { tag: R3, position: [-0.01, 0., 0.] }\n"
    "  - { tag: R4, position: [0., -0.01, 0.] }\n";

}  // namespace

TEST(MarkerPositionsTest, SharedRingIsRepeatedPerCrossSection) {
  TempDir dir;
  const MarkerPositions markers =
      MarkerPositions::from_yaml(dir.write("markers.yaml", kSharedRing));

  EXPECT_EQ(markers.size(), 3);
  EXPECT_EQ(markers.num_markers(), 12);
  EXPECT_EQ(markers.tags(1),
            (std::vector<std::string>{"R1", "R2", "R3", "R4"}));
  EXPECT_EQ(markers.marker_index(0, "R1"), 0);
  EXPECT_EQ(markers.marker_index(1, "R2"), 5);
  EXPECT_EQ(markers.marker_index(2, "R4"), 11);
  EXPECT_TRUE(markers.get_position(2, "R3").isApprox(
      Eigen::Vector3d(-0.01, 0., 0.)));
  EXPECT_TRUE(markers.get_basis().isIdentity());
}

TEST(MarkerPositionsTest, ExplicitCrossSections) {
  TempDir dir;
  const MarkerPositions markers = MarkerPositions::from_yaml(dir.write(
      "markers.yaml",
      "%YAML:1.0\n"
      "origin: [0., 0., 0.1]\n"
      "cross_sections:\n"
      "  - [ { tag: A, position: [1., 0., 0.] }, { tag: B, position: [0., 1., 0.] } ]\n"
      "  - [ { tag: C, position: [2., 0., 0.] } ]\n"));

  EXPECT_EQ(markers.size(), 2);
  EXPECT_EQ(markers.num_markers(), 3);
  EXPECT_TRUE(markers.contains(0, "B"));
  EXPECT_FALSE(markers.contains(1, "B"));
  EXPECT_EQ(markers.all_tags(), (std::vector<std::string>{"A", "B", "C"}));
  EXPECT_DOUBLE_EQ(markers.get_origin().z(), 0.1);
}

TEST(MarkerPositionsTest, EntriesAreOrderedByCrossSection) {
  const MarkerPositions markers(
      Eigen::Vector3d::Zero(), Eigen::Matrix3d::Identity(), 2,
      {{1, "X", Eigen::Vector3d(1, 0, 0)},
       {0, "Y", Eigen::Vector3d(0, 1, 0)},
       {1, "Z", Eigen::Vector3d(0, 0, 1)}});

  EXPECT_EQ(markers.marker(0).tag, "Y");
  EXPECT_EQ(markers.marker(1).tag, "X");
  EXPECT_EQ(markers.marker(2).tag, "Z");
  EXPECT_EQ(markers.marker_index(1, "Z"), 2);
}

TEST(MarkerPositionsTest, RejectsNonOrthonormalBasis) {
  Eigen::Matrix3d basis = Eigen::Matrix3d::Identity();
  basis(0, 1) = 0.5;
  EXPECT_THROW(MarkerPositions(Eigen::Vector3d::Zero(), basis, 1,
                               {{0, "R1", Eigen::Vector3d(1, 0, 0)}}),
               PreconditionError);
}

TEST(MarkerPositionsTest, RejectsDuplicateAndOutOfRangeMarkers) {
  EXPECT_THROW(MarkerPositions(Eigen::Vector3d::Zero(),
                               Eigen::Matrix3d::Identity(), 1,
                               {{0, "R1", Eigen::Vector3d(1, 0, 0)},
                                {0, "R1", Eigen::Vector3d(0, 1, 0)}}),
               PreconditionError);
  EXPECT_THROW(MarkerPositions(Eigen::Vector3d::Zero(),
                               Eigen::Matrix3d::Identity(), 1,
                               {{1, "R1", Eigen::Vector3d(1, 0, 0)}}),
               PreconditionError);
}

TEST(MarkerPositionsTest, UnknownMarkerThrows) {
  TempDir dir;
  const MarkerPositions markers =
      MarkerPositions::from_yaml(dir.write("markers.yaml", kSharedRing));
  EXPECT_THROW(markers.marker_index(0, "R9"), PreconditionError);
  EXPECT_THROW(markers.marker_index(3, "R1"), PreconditionError);
  EXPECT_THROW(MarkerPositions::from_yaml(dir.path("absent.yaml")),
               PreconditionError);
}

TEST(MarkerPositionsTest, Equality) {
  TempDir dir;
  const MarkerPositions a =
      MarkerPositions::from_yaml(dir.write("a.yaml", kSharedRing));
  const MarkerPositions b =
      MarkerPositions::from_yaml(dir.write("b.yaml", kSharedRing));
  const MarkerPositions c(Eigen::Vector3d::Zero(), Eigen::Matrix3d::Identity(),
                          1, {{0, "R1", Eigen::Vector3d(0.01, 0, 0)}});
  EXPECT_TRUE(a == b);
  EXPECT_TRUE(a != c);
}
