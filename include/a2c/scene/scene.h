// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_SCENE_SCENE_H
#define A2C_SCENE_SCENE_H

#include <optional>

#include <glm/glm.hpp>

namespace a2c {

/**
 * @brief Orientation frames a view can be aligned to
 */
class Scene {
 public:
  Scene();
  virtual ~Scene();

  /** Active custom transform orientation, if the scene has one */
  virtual std::optional<glm::mat3> CustomOrientation() const = 0;

  /** 3D cursor rotation, always available */
  virtual glm::mat3 CursorOrientation() const = 0;
};

/**
 * @brief Scene holding plain orientation values
 */
class SceneState : public Scene {
 public:
  SceneState();
  ~SceneState();

  std::optional<glm::mat3> CustomOrientation() const override;
  glm::mat3 CursorOrientation() const override;

  void SetCustomOrientation(const glm::mat3& m);
  void ClearCustomOrientation();
  void SetCursorOrientation(const glm::mat3& m);

 private:
  std::optional<glm::mat3> custom_;
  glm::mat3 cursor_ = glm::mat3(1.f);
};

}  // namespace a2c

#endif  // A2C_SCENE_SCENE_H
