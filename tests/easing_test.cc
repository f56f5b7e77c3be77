// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include <stdexcept>

#include <gtest/gtest.h>

#include "a2c/animation/easing.h"

namespace a2c {
namespace anim {
namespace {

TEST(EaseTest, FixedPoints) {
  EXPECT_FLOAT_EQ(Ease(0.f), 0.f);
  EXPECT_FLOAT_EQ(Ease(0.5f), 0.5f);
  EXPECT_FLOAT_EQ(Ease(1.f), 1.f);
}

TEST(EaseTest, MonotoneAndInRange) {
  float previous = Ease(0.f);
  for (int i = 1; i <= 1000; i++) {
    const float value = Ease(i / 1000.f);
    EXPECT_GE(value, previous);
    EXPECT_GE(value, 0.f);
    EXPECT_LE(value, 1.f);
    previous = value;
  }
}

TEST(EaseTest, SymmetricAboutMidpoint) {
  for (float x : {0.05f, 0.1f, 0.25f, 0.4f}) {
    EXPECT_NEAR(Ease(x) + Ease(1.f - x), 1.f, 1e-6f);
  }
}

TEST(EaseTest, SlowAtBothEnds) {
  EXPECT_LT(Ease(0.1f), 0.1f);
  EXPECT_GT(Ease(0.9f), 0.9f);
}

TEST(EaseTest, RejectsOutOfRange) {
  EXPECT_THROW(Ease(-0.001f), std::out_of_range);
  EXPECT_THROW(Ease(1.001f), std::out_of_range);
  EXPECT_THROW(Ease(-5.f), std::out_of_range);
}

TEST(EaseRangeTest, SizeAndEndpoints) {
  for (int n : {1, 2, 3, 7, 12, 100}) {
    auto values = EaseRange(n);
    ASSERT_EQ(values.size(), static_cast<size_t>(n + 1));
    EXPECT_FLOAT_EQ(values.front(), 0.f);
    EXPECT_FLOAT_EQ(values.back(), 1.f);
  }
}

TEST(EaseRangeTest, MatchesEaseAtEvenlySpacedInputs) {
  auto values = EaseRange(4);
  EXPECT_FLOAT_EQ(values[1], Ease(0.25f));
  EXPECT_FLOAT_EQ(values[2], 0.5f);
  EXPECT_FLOAT_EQ(values[3], Ease(0.75f));
}

TEST(EaseRangeTest, RejectsNonPositiveCount) {
  EXPECT_THROW(EaseRange(0), std::invalid_argument);
  EXPECT_THROW(EaseRange(-3), std::invalid_argument);
}

}  // namespace
}  // namespace anim
}  // namespace a2c
