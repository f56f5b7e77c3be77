// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include <a2c/scene/viewpoint.h>

#include <stdexcept>

#include "a2c/engine/utils/math.h"
#include "core/string.h"

namespace a2c {

namespace {

const glm::vec3 kAxisX(1.f, 0.f, 0.f);
const glm::vec3 kAxisY(0.f, 1.f, 0.f);

}  // namespace

glm::mat3 ViewpointMatrix(Viewpoint viewpoint) {
  switch (viewpoint) {
    case Viewpoint::Bottom:
      return math::RotationMatrix3(180.f, kAxisX);
    case Viewpoint::Front:
      return math::RotationMatrix3(90.f, kAxisX);
    case Viewpoint::Back:
      return math::RotationMatrix3(90.f, kAxisX) *
             math::RotationMatrix3(180.f, kAxisY);
    case Viewpoint::Right:
      return math::RotationMatrix3(90.f, kAxisX) *
             math::RotationMatrix3(90.f, kAxisY);
    case Viewpoint::Left:
      return math::RotationMatrix3(90.f, kAxisX) *
             math::RotationMatrix3(-90.f, kAxisY);
    case Viewpoint::Top:
    default:
      return glm::mat3(1.f);
  }
}

glm::mat3 TargetMatrix(const glm::mat3& source, Viewpoint viewpoint) {
  return source * ViewpointMatrix(viewpoint);
}

Viewpoint ParseViewpoint(const std::string& name) {
  std::string name_lower = str::to_lower(name);

  if (name_lower == "top") {
    return Viewpoint::Top;
  } else if (name_lower == "bottom") {
    return Viewpoint::Bottom;
  } else if (name_lower == "front") {
    return Viewpoint::Front;
  } else if (name_lower == "back") {
    return Viewpoint::Back;
  } else if (name_lower == "right") {
    return Viewpoint::Right;
  } else if (name_lower == "left") {
    return Viewpoint::Left;
  }
  throw std::invalid_argument("invalid viewpoint: " + name);
}

OrientationSource ParseOrientationSource(const std::string& name) {
  std::string name_lower = str::to_lower(name);

  if (name_lower == "custom") {
    return OrientationSource::Custom;
  } else if (name_lower == "cursor") {
    return OrientationSource::Cursor;
  }
  throw std::invalid_argument("invalid orientation source: " + name);
}

const char* ToString(Viewpoint viewpoint) {
  switch (viewpoint) {
    case Viewpoint::Top: return "top";
    case Viewpoint::Bottom: return "bottom";
    case Viewpoint::Front: return "front";
    case Viewpoint::Back: return "back";
    case Viewpoint::Right: return "right";
    case Viewpoint::Left: return "left";
  }
  return "unknown";
}

const char* ToString(OrientationSource source) {
  switch (source) {
    case OrientationSource::Custom: return "custom";
    case OrientationSource::Cursor: return "cursor";
  }
  return "unknown";
}

}  // namespace a2c
