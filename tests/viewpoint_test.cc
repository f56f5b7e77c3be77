// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>

#include <a2c/scene/viewpoint.h>

#include "a2c/engine/utils/math.h"

namespace a2c {
namespace {

/// Build a matrix from its rows
glm::mat3 Rows(const glm::vec3& r0, const glm::vec3& r1, const glm::vec3& r2) {
  return glm::transpose(glm::mat3(r0, r1, r2));
}

void ExpectMatrixNear(const glm::mat3& a, const glm::mat3& b, float epsilon = 1e-6f) {
  for (int c = 0; c < 3; c++) {
    for (int r = 0; r < 3; r++) {
      EXPECT_NEAR(a[c][r], b[c][r], epsilon) << "column " << c << " row " << r;
    }
  }
}

TEST(ViewpointTest, TopIsIdentity) {
  ExpectMatrixNear(ViewpointMatrix(Viewpoint::Top), glm::mat3(1.f));
}

TEST(ViewpointTest, RotationTable) {
  ExpectMatrixNear(ViewpointMatrix(Viewpoint::Bottom),
                   Rows({1, 0, 0}, {0, -1, 0}, {0, 0, -1}));
  ExpectMatrixNear(ViewpointMatrix(Viewpoint::Front),
                   Rows({1, 0, 0}, {0, 0, -1}, {0, 1, 0}));
  ExpectMatrixNear(ViewpointMatrix(Viewpoint::Back),
                   Rows({-1, 0, 0}, {0, 0, 1}, {0, 1, 0}));
  ExpectMatrixNear(ViewpointMatrix(Viewpoint::Right),
                   Rows({0, 0, 1}, {1, 0, 0}, {0, 1, 0}));
  ExpectMatrixNear(ViewpointMatrix(Viewpoint::Left),
                   Rows({0, 0, -1}, {-1, 0, 0}, {0, 1, 0}));
}

TEST(ViewpointTest, FrontLooksAlongPositiveY) {
  auto forward = ViewpointMatrix(Viewpoint::Front) * glm::vec3(0.f, 0.f, -1.f);
  EXPECT_NEAR(forward.y, 1.f, 1e-6f);
}

TEST(ViewpointTest, TargetComposesSourceFirst) {
  const float c = std::sqrt(0.5f);
  auto cursor = Rows({c, -c, 0}, {c, c, 0}, {0, 0, 1});  // 45 deg about Z

  auto target = TargetMatrix(cursor, Viewpoint::Right);
  ExpectMatrixNear(target, Rows({-c, 0, c}, {c, 0, c}, {0, 1, 0}));

  // the other composition order gives a different frame
  auto reversed = ViewpointMatrix(Viewpoint::Right) * cursor;
  EXPECT_GT(std::abs(reversed[0][0] - target[0][0]) +
                std::abs(reversed[2][1] - target[2][1]),
            0.1f);
}

TEST(ViewpointTest, ParseNames) {
  EXPECT_EQ(ParseViewpoint("top"), Viewpoint::Top);
  EXPECT_EQ(ParseViewpoint("BOTTOM"), Viewpoint::Bottom);
  EXPECT_EQ(ParseViewpoint("Front"), Viewpoint::Front);
  EXPECT_EQ(ParseViewpoint("back"), Viewpoint::Back);
  EXPECT_EQ(ParseViewpoint("right"), Viewpoint::Right);
  EXPECT_EQ(ParseViewpoint("left"), Viewpoint::Left);
  EXPECT_THROW(ParseViewpoint("side"), std::invalid_argument);

  EXPECT_EQ(ParseOrientationSource("custom"), OrientationSource::Custom);
  EXPECT_EQ(ParseOrientationSource("CURSOR"), OrientationSource::Cursor);
  EXPECT_THROW(ParseOrientationSource("global"), std::invalid_argument);
}

TEST(ViewpointTest, NamesRoundTrip) {
  for (auto viewpoint : {Viewpoint::Top, Viewpoint::Bottom, Viewpoint::Front,
                         Viewpoint::Back, Viewpoint::Right, Viewpoint::Left}) {
    EXPECT_EQ(ParseViewpoint(ToString(viewpoint)), viewpoint);
  }
}

}  // namespace
}  // namespace a2c
