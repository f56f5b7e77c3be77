// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>

#include "a2c/engine/utils/math.h"
#include "a2c/scene/scene_file.h"

namespace a2c {
namespace {

TEST(SceneFileTest, ReadsFullDescription) {
  auto scene_file = SceneFile::FromString(
      "viewport:\n"
      "  type: view_3d\n"
      "  quat: [0.0, 1.0, 0.0, 0.0]\n"
      "  projection: orthographic\n"
      "cursor:\n"
      "  quat: [0.9238795, 0.0, 0.0, 0.3826834]\n"
      "custom_orientation:\n"
      "  matrix:\n"
      "    - [0.0, -1.0, 0.0]\n"
      "    - [1.0, 0.0, 0.0]\n"
      "    - [0.0, 0.0, 1.0]\n");

  EXPECT_EQ(scene_file.view_type(), ViewType::View3D);
  EXPECT_EQ(scene_file.projection(), Projection::Orthographic);
  EXPECT_TRUE(math::SameRotation(scene_file.view_orientation(),
                                 glm::quat(0.f, 1.f, 0.f, 0.f)));

  auto cursor_x = scene_file.cursor() * glm::vec3(1.f, 0.f, 0.f);
  EXPECT_NEAR(cursor_x.x, std::sqrt(0.5f), 1e-5f);
  EXPECT_NEAR(cursor_x.y, std::sqrt(0.5f), 1e-5f);

  // rows are read as rows: 90 deg about Z sends +X to +Y
  ASSERT_TRUE(scene_file.custom_orientation().has_value());
  auto custom_x = *scene_file.custom_orientation() * glm::vec3(1.f, 0.f, 0.f);
  EXPECT_NEAR(custom_x.y, 1.f, 1e-6f);
}

TEST(SceneFileTest, DefaultsWhenSectionsAreMissing) {
  auto scene_file = SceneFile::FromString("viewport:\n  type: other\n");

  EXPECT_EQ(scene_file.view_type(), ViewType::Other);
  EXPECT_EQ(scene_file.projection(), Projection::Perspective);
  EXPECT_FALSE(scene_file.custom_orientation().has_value());
  EXPECT_EQ(scene_file.cursor(), glm::mat3(1.f));
}

TEST(SceneFileTest, MakesSceneAndViewport) {
  auto scene_file = SceneFile::FromString(
      "viewport:\n"
      "  quat: [0.0, 0.0, 2.0, 0.0]\n"
      "custom_orientation:\n"
      "  quat: [1.0, 0.0, 0.0, 0.0]\n");

  auto scene = scene_file.MakeScene();
  EXPECT_TRUE(scene->CustomOrientation().has_value());

  auto viewport = scene_file.MakeViewport();
  EXPECT_EQ(viewport->Type(), ViewType::View3D);
  EXPECT_TRUE(math::SameRotation(viewport->Orientation(), glm::quat(0.f, 0.f, 1.f, 0.f)));
}

TEST(SceneFileTest, RejectsMalformedEntries) {
  EXPECT_THROW(SceneFile::FromString("viewport:\n  quat: [1.0, 0.0]\n"),
               std::invalid_argument);
  EXPECT_THROW(SceneFile::FromString("viewport:\n  type: image\n"),
               std::invalid_argument);
  EXPECT_THROW(SceneFile::FromString("cursor:\n  matrix: [[1, 0, 0], [0, 1, 0]]\n"),
               std::invalid_argument);
  EXPECT_THROW(SceneFile::FromString("cursor:\n  position: [0, 0, 0]\n"),
               std::invalid_argument);
  EXPECT_THROW(SceneFile::FromString("viewport: [unclosed\n"), std::invalid_argument);
}

TEST(SceneFileTest, MissingFile) {
  EXPECT_THROW(SceneFile("/nonexistent/a2c/scene.yaml"), std::invalid_argument);
}

}  // namespace
}  // namespace a2c
