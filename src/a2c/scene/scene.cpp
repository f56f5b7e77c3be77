// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include <a2c/scene/scene.h>

namespace a2c {

Scene::Scene() {}

Scene::~Scene() {}

SceneState::SceneState() {}

SceneState::~SceneState() {}

std::optional<glm::mat3> SceneState::CustomOrientation() const {
  return custom_;
}

glm::mat3 SceneState::CursorOrientation() const { return cursor_; }

void SceneState::SetCustomOrientation(const glm::mat3& m) { custom_ = m; }

void SceneState::ClearCustomOrientation() { custom_.reset(); }

void SceneState::SetCursorOrientation(const glm::mat3& m) { cursor_ = m; }

}  // namespace a2c
