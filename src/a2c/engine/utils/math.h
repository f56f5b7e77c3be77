// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_ENGINE_MATH_H
#define A2C_ENGINE_MATH_H

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/quaternion.hpp>

#include "core/structs.h"


namespace a2c {
namespace math {

/// @brief Elemental rotation matrix about a local axis.
/// @param degrees Rotation angle in degrees.
/// @param axis Rotation axis, e.g. glm::vec3(1, 0, 0).
/// @return 3x3 rotation matrix.
glm::mat3 RotationMatrix3(float degrees, const glm::vec3& axis);

/// @brief Convert a rotation matrix to a unit quaternion.
glm::quat ToQuaternion(const glm::mat3& m);

/// @brief Rotation taking orientation a to orientation b, i.e. inverse(a) * b.
glm::quat RotationDifference(const glm::quat& a, const glm::quat& b);

/// @brief Axis and angle of a rotation. The angle is folded into [0, pi]
/// since q and -q describe the same rotation.
core::AxisAngle ToAxisAngle(const glm::quat& q);

/// @brief Angle of the shortest rotation between two orientations.
/// @return angle in radians, in [0, pi].
float AngleBetween(const glm::quat& start, const glm::quat& end);

/// @brief Spherical linear interpolation along the shortest arc.
/// @param progress interpolation factor, 0 gives start and 1 gives end.
glm::quat Slerp(const glm::quat& start, const glm::quat& end, float progress);

/// @brief True when both quaternions describe the same rotation (q ~ -q).
bool SameRotation(const glm::quat& a, const glm::quat& b, float epsilon = 1e-6f);

};
};  // namespace

#endif  // A2C_ENGINE_MATH_H
