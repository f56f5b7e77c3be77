// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_ANIMATION_ANIMATOR_MANAGER_H
#define A2C_ANIMATION_ANIMATOR_MANAGER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "a2c/animation/rotation_animator.h"
#include "a2c/scene/viewport.h"

namespace a2c {
namespace anim {

/**
 * @brief Runs at most one rotation animation at a time
 *
 * The busy flag is raised by TryAcquire on the requesting thread and lowered
 * by Release on the animator thread when the animation ends. Requests made
 * while it is raised are meant to be dropped by the caller.
 */
class AnimatorManager {
 public:
  AnimatorManager();

  /** Cancels the running animation and joins its thread */
  ~AnimatorManager();

  AnimatorManager(const AnimatorManager&) = delete;
  AnimatorManager& operator=(const AnimatorManager&) = delete;

  /**
   * @brief Raise the busy flag
   * @return false if an animation already holds it
   */
  bool TryAcquire();

  /** Lower the busy flag */
  void Release();

  bool Busy() const;

  /**
   * @brief Start an animation on a new thread
   *
   * The caller must hold the busy flag; it is released by the animator
   * thread once the end orientation is written or the sink has gone away.
   *
   * @throws std::logic_error when the busy flag is not held
   */
  void Start(const RotationAnimator& animator, const AnimationRequest& request,
             std::weak_ptr<Viewport> sink);

  /**
   * @brief Stop emitting intermediate samples. The end orientation is still
   * written.
   */
  void Cancel();

  /** Block until the running animation, if any, has finished */
  void Wait();

  /** Number of orientations written by the last finished animation */
  uint32_t last_write_count() const { return last_write_count_; }

 private:
  void Join();

  std::atomic_bool busy_ = false;
  std::atomic_bool cancel_ = false;
  std::atomic<uint32_t> last_write_count_ = 0;

  std::mutex mutex_;
  std::thread thread_;
};

}  // namespace anim
}  // namespace a2c

#endif  // A2C_ANIMATION_ANIMATOR_MANAGER_H
