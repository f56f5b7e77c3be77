// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>

#include "a2c/animation/animator_manager.h"
#include "recording_viewport.h"

namespace a2c {
namespace anim {
namespace {

const glm::quat kIdentity(1.f, 0.f, 0.f, 0.f);
const glm::quat kHalfTurnX(0.f, 1.f, 0.f, 0.f);

RotationAnimator SlowAnimator() {
  AnimationParams params;
  params.strategy = Strategy::FrameCount;
  params.max_frames = 20;
  params.frame_delay = 0.01f;
  return RotationAnimator(params);
}

TEST(AnimatorManagerTest, AcquireIsExclusive) {
  AnimatorManager manager;
  EXPECT_FALSE(manager.Busy());
  EXPECT_TRUE(manager.TryAcquire());
  EXPECT_TRUE(manager.Busy());
  EXPECT_FALSE(manager.TryAcquire());
  manager.Release();
  EXPECT_FALSE(manager.Busy());
  EXPECT_TRUE(manager.TryAcquire());
  manager.Release();
}

TEST(AnimatorManagerTest, StartRequiresTheBusyFlag) {
  AnimatorManager manager;
  auto viewport = std::make_shared<test::RecordingViewport>();
  EXPECT_THROW(manager.Start(SlowAnimator(), {kIdentity, kHalfTurnX}, viewport),
               std::logic_error);
  EXPECT_EQ(viewport->write_count(), 0u);
}

TEST(AnimatorManagerTest, AnimationReleasesTheFlag) {
  AnimatorManager manager;
  auto viewport = std::make_shared<test::RecordingViewport>();

  ASSERT_TRUE(manager.TryAcquire());
  manager.Start(SlowAnimator(), {kIdentity, kHalfTurnX}, viewport);
  manager.Wait();

  EXPECT_FALSE(manager.Busy());
  EXPECT_EQ(viewport->writes().back(), kHalfTurnX);
  EXPECT_EQ(manager.last_write_count(), viewport->write_count());
}

TEST(AnimatorManagerTest, RunsOffTheCallingThread) {
  AnimatorManager manager;
  auto viewport = std::make_shared<test::RecordingViewport>();

  ASSERT_TRUE(manager.TryAcquire());
  manager.Start(SlowAnimator(), {kIdentity, kHalfTurnX}, viewport);

  // about 20 frames of 10 ms are still to come
  EXPECT_TRUE(manager.Busy());
  EXPECT_LT(viewport->write_count(), 20u);

  manager.Wait();
  EXPECT_FALSE(manager.Busy());
}

TEST(AnimatorManagerTest, SecondRequestIsRejectedWhileBusy) {
  AnimatorManager manager;
  auto first = std::make_shared<test::RecordingViewport>();
  auto second = std::make_shared<test::RecordingViewport>();

  ASSERT_TRUE(manager.TryAcquire());
  manager.Start(SlowAnimator(), {kIdentity, kHalfTurnX}, first);

  EXPECT_FALSE(manager.TryAcquire());
  manager.Wait();

  EXPECT_EQ(second->write_count(), 0u);
  auto expected = FrameSamples({kIdentity, kHalfTurnX}, 20);
  EXPECT_EQ(first->write_count(), expected.size());
  EXPECT_EQ(first->writes().back(), kHalfTurnX);
}

TEST(AnimatorManagerTest, ReleasesTheFlagWithoutSink) {
  AnimatorManager manager;
  std::weak_ptr<Viewport> sink;

  ASSERT_TRUE(manager.TryAcquire());
  manager.Start(SlowAnimator(), {kIdentity, kHalfTurnX}, sink);
  manager.Wait();

  EXPECT_FALSE(manager.Busy());
  EXPECT_EQ(manager.last_write_count(), 0u);
}

TEST(AnimatorManagerTest, CancelStillWritesTheEnd) {
  AnimatorManager manager;
  auto viewport = std::make_shared<test::RecordingViewport>();

  ASSERT_TRUE(manager.TryAcquire());
  manager.Start(SlowAnimator(), {kIdentity, kHalfTurnX}, viewport);
  manager.Cancel();
  manager.Wait();

  EXPECT_FALSE(manager.Busy());
  EXPECT_LT(viewport->write_count(), FrameSamples({kIdentity, kHalfTurnX}, 20).size());
  EXPECT_EQ(viewport->writes().back(), kHalfTurnX);
}

TEST(AnimatorManagerTest, CanStartAgainAfterCompletion) {
  AnimatorManager manager;
  auto viewport = std::make_shared<test::RecordingViewport>();

  ASSERT_TRUE(manager.TryAcquire());
  manager.Start(SlowAnimator(), {kIdentity, kHalfTurnX}, viewport);
  manager.Wait();

  ASSERT_TRUE(manager.TryAcquire());
  manager.Start(SlowAnimator(), {kHalfTurnX, kIdentity}, viewport);
  manager.Wait();

  EXPECT_EQ(viewport->writes().back(), kIdentity);
}

TEST(AnimatorManagerTest, DestructorWaitsForTheAnimation) {
  auto viewport = std::make_shared<test::RecordingViewport>();
  {
    AnimatorManager manager;
    ASSERT_TRUE(manager.TryAcquire());
    manager.Start(SlowAnimator(), {kIdentity, kHalfTurnX}, viewport);
  }
  EXPECT_EQ(viewport->writes().back(), kHalfTurnX);
}

}  // namespace
}  // namespace anim
}  // namespace a2c
