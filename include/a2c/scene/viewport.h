// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_SCENE_VIEWPORT_H
#define A2C_SCENE_VIEWPORT_H

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace a2c {

/**
 * @brief Kind of editor area a viewport belongs to
 */
enum class ViewType {
  /**3D view, the only type that can be aligned*/
  View3D,
  /**Any other editor (image, node, text, ...)*/
  Other,
};

/**
 * @brief Viewport projection mode
 */
enum class Projection {
  Perspective,
  Orthographic,
};

/**
 * @brief Host viewport seen by the aligner
 *
 * SetOrientation is called from the animator thread while an animation runs,
 * implementations must tolerate that.
 */
class Viewport {
 public:
  Viewport();
  virtual ~Viewport();

  virtual ViewType Type() const = 0;

  /** View rotation, camera to world */
  virtual glm::quat Orientation() const = 0;
  virtual void SetOrientation(const glm::quat& orientation) = 0;

  virtual Projection projection() const = 0;
  virtual void SetProjection(Projection projection) = 0;
};

}  // namespace a2c

#endif  // A2C_SCENE_VIEWPORT_H
