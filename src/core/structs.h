// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef CORE_STRUCTS_H
#define CORE_STRUCTS_H

#include <glm/glm.hpp>

namespace core {

/**
 * @brief Rotation expressed as a unit axis and an angle
 * The angle is in radians, in [0, pi]
 */
struct AxisAngle {
  glm::vec3 axis;
  float angle;
};

}

#endif
