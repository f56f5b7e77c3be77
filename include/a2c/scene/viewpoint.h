// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_SCENE_VIEWPOINT_H
#define A2C_SCENE_VIEWPOINT_H

#include <string>

#include <glm/glm.hpp>

/// \file

namespace a2c {

/**
 * @brief Canonical viewpoints, relative to an orientation frame
 */
enum class Viewpoint {
  Top = 1,
  Bottom = 2,
  Front = 3,
  Back = 4,
  Right = 5,
  Left = 6,
};

/**
 * @brief Orientation frame a viewpoint is expressed in
 */
enum class OrientationSource {
  /**Active custom transform orientation of the scene*/
  Custom = 1,
  /**3D cursor rotation*/
  Cursor = 2,
};

/**
 * @brief Fixed rotation of a viewpoint, composed from local X then Y
 * rotations. Top is the identity.
 */
glm::mat3 ViewpointMatrix(Viewpoint viewpoint);

/**
 * @brief Orientation of a viewpoint expressed in a source frame
 * @return source * ViewpointMatrix(viewpoint)
 */
glm::mat3 TargetMatrix(const glm::mat3& source, Viewpoint viewpoint);

Viewpoint ParseViewpoint(const std::string& name);
OrientationSource ParseOrientationSource(const std::string& name);

const char* ToString(Viewpoint viewpoint);
const char* ToString(OrientationSource source);

}  // namespace a2c

#endif  // A2C_SCENE_VIEWPOINT_H
