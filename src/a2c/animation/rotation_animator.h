// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_ANIMATION_ROTATION_ANIMATOR_H
#define A2C_ANIMATION_ROTATION_ANIMATOR_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "a2c/scene/viewport.h"

namespace a2c {
namespace anim {

/**
 * @brief How an animation paces its samples
 */
enum class Strategy {
  /**Sample on wall-clock ticks over a duration scaled by the angle*/
  Duration,
  /**Emit a fixed list of eased samples, count scaled by the angle*/
  FrameCount,
};

/**
 * @brief Pacing parameters of a rotation animation
 */
struct AnimationParams {
  Strategy strategy = Strategy::Duration;
  float max_duration = 0.24f;  // seconds for a half turn
  float step = 0.02f;          // seconds between duration ticks
  uint32_t max_frames = 12;    // frames for a half turn
  float frame_delay = 0.02f;   // seconds between frames
};

/**
 * @brief Rotation from the current view orientation to a target
 */
struct AnimationRequest {
  glm::quat start;
  glm::quat end;
};

/// @brief Duration of a turn: max_duration * angle / pi.
float ComputeDuration(float angle, float max_duration);

/// @brief Frame count of a turn: max(1, floor(max_frames * angle / pi)).
uint32_t ComputeFrameCount(float angle, uint32_t max_frames);

/// @brief Orientations emitted by the frame count strategy, first is start
/// and last is exactly end.
std::vector<glm::quat> FrameSamples(const AnimationRequest& request,
                                    uint32_t max_frames);

/**
 * @brief Drives a viewport from a start to an end orientation
 *
 * Run blocks the calling thread until the end orientation is written; the
 * manager calls it on a dedicated thread. The sink is re-locked before each
 * write and the animation stops silently once it has expired.
 */
class RotationAnimator {
 public:
  RotationAnimator();
  explicit RotationAnimator(AnimationParams params);
  ~RotationAnimator();

  const AnimationParams& params() const noexcept { return params_; }

  /**
   * @brief Play the animation
   * @param request start and end orientations
   * @param sink viewport receiving the orientations
   * @param cancel when set, intermediate samples are skipped and only the
   *   final end orientation is written
   * @return number of orientations written
   */
  uint32_t Run(const AnimationRequest& request, std::weak_ptr<Viewport> sink,
               const std::atomic_bool& cancel) const;

 private:
  uint32_t RunDuration(const AnimationRequest& request,
                       const std::weak_ptr<Viewport>& sink,
                       const std::atomic_bool& cancel) const;
  uint32_t RunFrameCount(const AnimationRequest& request,
                         const std::weak_ptr<Viewport>& sink,
                         const std::atomic_bool& cancel) const;

  AnimationParams params_;
};

}  // namespace anim
}  // namespace a2c

#endif  // A2C_ANIMATION_ROTATION_ANIMATOR_H
