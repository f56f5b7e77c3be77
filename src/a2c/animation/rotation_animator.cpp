// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include "a2c/animation/rotation_animator.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

#include <glm/gtc/constants.hpp>

#include "a2c/animation/easing.h"
#include "a2c/engine/utils/math.h"

namespace a2c {
namespace anim {

namespace {

using Clock = std::chrono::steady_clock;
using Seconds = std::chrono::duration<float>;

/**
 * @brief Write an orientation if the viewport is still alive
 * @return false when the viewport has gone away
 */
bool Write(const std::weak_ptr<Viewport>& sink, const glm::quat& orientation) {
  auto viewport = sink.lock();
  if (!viewport) {
    return false;
  }
  viewport->SetOrientation(orientation);
  return true;
}

}  // namespace

float ComputeDuration(float angle, float max_duration) {
  return std::abs(max_duration * angle / glm::pi<float>());
}

uint32_t ComputeFrameCount(float angle, uint32_t max_frames) {
  // ratio clamped so a rounding excess on a half turn cannot add a frame
  const double ratio =
      std::clamp(static_cast<double>(angle) / glm::pi<double>(), 0.0, 1.0);
  const auto nb_frames =
      static_cast<uint32_t>(std::floor(static_cast<double>(max_frames) * ratio));
  return std::max<uint32_t>(1, nb_frames);
}

std::vector<glm::quat> FrameSamples(const AnimationRequest& request,
                                    uint32_t max_frames) {
  const float angle = math::AngleBetween(request.start, request.end);
  const uint32_t nb_frames = ComputeFrameCount(angle, max_frames);

  std::vector<glm::quat> output;
  for (float progress : EaseRange(static_cast<int>(nb_frames))) {
    if (progress >= 1.f) {
      output.push_back(request.end);
    } else {
      output.push_back(math::Slerp(request.start, request.end, progress));
    }
  }
  return output;
}

RotationAnimator::RotationAnimator() = default;

RotationAnimator::RotationAnimator(AnimationParams params) : params_(params) {}

RotationAnimator::~RotationAnimator() = default;

uint32_t RotationAnimator::Run(const AnimationRequest& request,
                               std::weak_ptr<Viewport> sink,
                               const std::atomic_bool& cancel) const {
  if (sink.expired()) {
    return 0;
  }

  switch (params_.strategy) {
    case Strategy::FrameCount:
      return RunFrameCount(request, sink, cancel);
    case Strategy::Duration:
    default:
      return RunDuration(request, sink, cancel);
  }
}

uint32_t RotationAnimator::RunDuration(const AnimationRequest& request,
                                       const std::weak_ptr<Viewport>& sink,
                                       const std::atomic_bool& cancel) const {
  const float angle = math::AngleBetween(request.start, request.end);
  const float duration = ComputeDuration(angle, params_.max_duration);
  const Seconds step(params_.step);

  uint32_t count = 0;
  const auto start_time = Clock::now();
  float elapsed = 0.f;

  while (elapsed <= duration && !cancel) {
    float progress = 1.f;
    if (duration > 0.f) {
      progress = Ease(std::min(elapsed / duration, 1.f));
    }
    if (!Write(sink, math::Slerp(request.start, request.end, progress))) {
      return count;
    }
    count++;

    std::this_thread::sleep_for(step);
    elapsed = std::chrono::duration_cast<Seconds>(Clock::now() - start_time).count();
  }

  // exact terminal orientation, whatever the sampling drift
  if (!Write(sink, request.end)) {
    return count;
  }
  return count + 1;
}

uint32_t RotationAnimator::RunFrameCount(const AnimationRequest& request,
                                         const std::weak_ptr<Viewport>& sink,
                                         const std::atomic_bool& cancel) const {
  const auto samples = FrameSamples(request, params_.max_frames);
  const Seconds frame_delay(params_.frame_delay);

  uint32_t count = 0;
  for (size_t i = 0; i + 1 < samples.size() && !cancel; i++) {
    if (!Write(sink, samples[i])) {
      return count;
    }
    count++;
    std::this_thread::sleep_for(frame_delay);
  }

  if (!Write(sink, samples.back())) {
    return count;
  }
  return count + 1;
}

}  // namespace anim
}  // namespace a2c
