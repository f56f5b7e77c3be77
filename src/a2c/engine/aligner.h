// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_ENGINE_ALIGNER_H
#define A2C_ENGINE_ALIGNER_H

#include <memory>
#include <optional>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <a2c/engine/align_api.h>
#include <a2c/scene/scene.h>
#include <a2c/scene/viewpoint.h>
#include <a2c/scene/viewport.h>

#include "a2c/animation/animator_manager.h"
#include "a2c/animation/rotation_animator.h"
#include "a2c/engine/config.h"

namespace a2c {

/**
 * @brief Aligns a viewport to a viewpoint of the custom orientation or the
 * 3D cursor
 *
 * Align is meant to be called from a single thread (the host UI thread).
 * Smooth rotations run on the animator thread owned by this object; at most
 * one runs at a time and requests made meanwhile are dropped.
 */
class Aligner {
 public:
  Aligner(Config config, std::shared_ptr<Viewport> viewport,
          std::shared_ptr<const Scene> scene);
  ~Aligner();

  /**
   * @brief Align the viewport
   *
   * Switches the viewport to orthographic projection, then writes the target
   * orientation at once or launches a smooth rotation, depending on
   * Config::smooth(). Never throws for unavailable sources or busy state.
   */
  AlignStatus Align(Viewpoint viewpoint, OrientationSource source);

  /**
   * @brief Target orientation of a request
   * @return nothing when the custom source is requested but absent
   */
  std::optional<glm::quat> TargetOrientation(Viewpoint viewpoint,
                                             OrientationSource source) const;

  bool Busy() const { return manager_.Busy(); }
  void Wait() { manager_.Wait(); }
  void Cancel() { manager_.Cancel(); }

  const Config& config() const noexcept { return config_; }
  Config& config() noexcept { return config_; }

  anim::AnimatorManager& manager() noexcept { return manager_; }

 private:
  Config config_;
  std::shared_ptr<Viewport> viewport_;
  std::shared_ptr<const Scene> scene_;

  anim::AnimatorManager manager_;
};

}  // namespace a2c

#endif  // A2C_ENGINE_ALIGNER_H
