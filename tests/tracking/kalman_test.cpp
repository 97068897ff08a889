#include "ringtrack/kalman.hpp"
#include <gtest/gtest.h>

using namespace ringtrack;

TEST(KalmanTest, StartsAtRest) {
  Kalman kalman(Pt(50, 60));
  EXPECT_EQ(kalman.position(), Pt(50, 60));
  EXPECT_EQ(kalman.velocity(), Pt(0, 0));
  EXPECT_EQ(kalman.predict(), Pt(50, 60));
}

TEST(KalmanTest, ConvergesOnConstantVelocity) {
  Kalman kalman(Pt(100, 50));
  for (int f = 1; f < 30; f++) {
    kalman.predict();
    kalman.update(Pt(100 + 3 * f, 50 + 2 * f));
  }
  EXPECT_NEAR(kalman.velocity().x, 3.0, 1e-3);
  EXPECT_NEAR(kalman.velocity().y, 2.0, 1e-3);

  const Pt next = kalman.predict();
  EXPECT_NEAR(next.x, 100 + 3 * 30, 1e-3);
  EXPECT_NEAR(next.y, 50 + 2 * 30, 1e-3);
}

TEST(KalmanTest, UpdatePullsTowardsMeasurement) {
  Kalman kalman(Pt(0, 0));
  kalman.predict();
  const Pt corrected = kalman.update(Pt(10, -10));
  EXPECT_GT(corrected.x, 0);
  EXPECT_LT(corrected.x, 10);
  EXPECT_LT(corrected.y, 0);
  EXPECT_GT(corrected.y, -10);
}
