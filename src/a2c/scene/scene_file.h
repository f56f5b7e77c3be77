// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_SCENE_SCENE_FILE_H
#define A2C_SCENE_SCENE_FILE_H

#include <memory>
#include <optional>
#include <string>

#include "yaml-cpp/yaml.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <a2c/scene/scene.h>
#include <a2c/scene/viewport.h>
#include <a2c/scene/viewport_camera.h>

namespace a2c {

/**
 * @brief Snapshot of a host scene and its 3D view, read from a .yaml file
 */
class SceneFile {
 public:
  SceneFile() = delete;
  SceneFile(const std::string& filename);
  ~SceneFile() = default;

  static SceneFile FromString(const std::string& text);

  ViewType view_type() const noexcept { return view_type_; }
  const glm::quat& view_orientation() const noexcept { return view_orientation_; }
  Projection projection() const noexcept { return projection_; }
  const glm::mat3& cursor() const noexcept { return cursor_; }
  const std::optional<glm::mat3>& custom_orientation() const noexcept {
    return custom_orientation_;
  }

  std::shared_ptr<SceneState> MakeScene() const;
  std::shared_ptr<ViewportCamera> MakeViewport() const;

 private:
  SceneFile(const YAML::Node& root, const std::string& origin);

  std::string origin_;
  ViewType view_type_ = ViewType::View3D;
  glm::quat view_orientation_ = glm::quat(1.f, 0.f, 0.f, 0.f);
  Projection projection_ = Projection::Perspective;
  glm::mat3 cursor_ = glm::mat3(1.f);
  std::optional<glm::mat3> custom_orientation_;
};

}  // namespace a2c

#endif  // A2C_SCENE_SCENE_FILE_H
