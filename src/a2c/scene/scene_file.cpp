// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include "a2c/scene/scene_file.h"

#include <stdexcept>
#include <vector>

#include "a2c/engine/utils/math.h"
#include "core/string.h"

namespace a2c {

namespace {

glm::quat ReadQuat(const YAML::Node& node, const std::string& origin) {
  auto quat = node.as<std::vector<float>>();
  if (quat.size() != 4) {
    throw std::invalid_argument(origin + ": quaternion needs 4 values [w, x, y, z]");
  }
  auto q = glm::quat(quat[0], quat[1], quat[2], quat[3]);
  if (glm::length(q) < 1e-6f) {
    throw std::invalid_argument(origin + ": null quaternion");
  }
  return glm::normalize(q);
}

/**
 * @brief Read a 3x3 matrix written row by row
 */
glm::mat3 ReadMatrix(const YAML::Node& node, const std::string& origin) {
  if (!node.IsSequence() || node.size() != 3) {
    throw std::invalid_argument(origin + ": matrix needs 3 rows");
  }
  glm::mat3 m(1.f);
  for (uint32_t r = 0; r < 3; r++) {
    auto row = node[r].as<std::vector<float>>();
    if (row.size() != 3) {
      throw std::invalid_argument(origin + ": matrix rows need 3 values");
    }
    for (uint32_t c = 0; c < 3; c++) {
      // glm is column major
      m[c][r] = row[c];
    }
  }
  return m;
}

/**
 * @brief Orientation given either as `quat` or as `matrix`
 */
glm::mat3 ReadOrientation(const YAML::Node& node, const std::string& origin) {
  if (node["matrix"]) {
    return ReadMatrix(node["matrix"], origin);
  }
  if (node["quat"]) {
    return glm::mat3_cast(ReadQuat(node["quat"], origin));
  }
  throw std::invalid_argument(origin + ": orientation needs `quat` or `matrix`");
}

YAML::Node LoadFile(const std::string& filename) {
  try {
    return YAML::LoadFile(filename);
  } catch (const YAML::Exception& e) {
    throw std::invalid_argument("Incorrect scene file [.yaml]: " + filename +
                                ": " + e.what());
  }
}

}  // namespace

/**
 * @brief Scene file constructor
 * @param filename filename of the scene description (.yaml file)
 */
SceneFile::SceneFile(const std::string& filename)
    : SceneFile(LoadFile(filename), filename) {}

SceneFile SceneFile::FromString(const std::string& text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::invalid_argument(std::string("Incorrect scene description: ") + e.what());
  }
  return SceneFile(root, "<string>");
}

SceneFile::SceneFile(const YAML::Node& root, const std::string& origin)
    : origin_(origin) {
  try {
    if (auto viewport = root["viewport"]) {
      if (viewport["type"]) {
        auto type = str::to_lower(viewport["type"].as<std::string>());
        if (type == "view_3d") {
          view_type_ = ViewType::View3D;
        } else if (type == "other") {
          view_type_ = ViewType::Other;
        } else {
          throw std::invalid_argument(origin + ": invalid viewport type " + type);
        }
      }
      if (viewport["quat"]) {
        view_orientation_ = ReadQuat(viewport["quat"], origin);
      }
      if (viewport["projection"]) {
        auto projection = str::to_lower(viewport["projection"].as<std::string>());
        if (projection == "perspective") {
          projection_ = Projection::Perspective;
        } else if (projection == "orthographic" || projection == "ortho") {
          projection_ = Projection::Orthographic;
        } else {
          throw std::invalid_argument(origin + ": invalid projection " + projection);
        }
      }
    }

    if (auto cursor = root["cursor"]) {
      cursor_ = ReadOrientation(cursor, origin);
    }

    if (auto custom = root["custom_orientation"]) {
      if (!custom.IsNull()) {
        custom_orientation_ = ReadOrientation(custom, origin);
      }
    }
  } catch (const YAML::Exception& e) {
    throw std::invalid_argument(origin + ": " + e.what());
  }
}

std::shared_ptr<SceneState> SceneFile::MakeScene() const {
  auto scene = std::make_shared<SceneState>();
  scene->SetCursorOrientation(cursor_);
  if (custom_orientation_) {
    scene->SetCustomOrientation(*custom_orientation_);
  }
  return scene;
}

std::shared_ptr<ViewportCamera> SceneFile::MakeViewport() const {
  auto viewport = std::make_shared<ViewportCamera>(view_type_);
  viewport->SetOrientation(view_orientation_);
  viewport->SetProjection(projection_);
  return viewport;
}

}  // namespace a2c
