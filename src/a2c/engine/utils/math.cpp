// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include "a2c/engine/utils/math.h"

#include <algorithm>
#include <cmath>

#include <glm/gtc/constants.hpp>

namespace a2c {
namespace math {

glm::mat3 RotationMatrix3(float degrees, const glm::vec3& axis) {
  return glm::mat3_cast(glm::angleAxis(glm::radians(degrees), glm::normalize(axis)));
}

glm::quat ToQuaternion(const glm::mat3& m) {
  return glm::normalize(glm::quat_cast(m));
}

glm::quat RotationDifference(const glm::quat& a, const glm::quat& b) {
  return glm::normalize(glm::inverse(a) * b);
}

core::AxisAngle ToAxisAngle(const glm::quat& q) {
  auto n = glm::normalize(q);
  if (n.w < 0.f) {
    n = -n;
  }

  core::AxisAngle output{glm::vec3(0.f, 0.f, 1.f), 0.f};
  output.angle = 2.f * std::acos(std::clamp(n.w, -1.f, 1.f));

  const float s = std::sqrt(std::max(0.f, 1.f - n.w * n.w));
  if (s > 1e-6f) {
    output.axis = glm::vec3(n.x, n.y, n.z) / s;
  }
  return output;
}

float AngleBetween(const glm::quat& start, const glm::quat& end) {
  return ToAxisAngle(RotationDifference(end, start)).angle;
}

glm::quat Slerp(const glm::quat& start, const glm::quat& end, float progress) {
  // glm::slerp flips the sign of end when the arc is longer than pi
  return glm::slerp(start, end, progress);
}

bool SameRotation(const glm::quat& a, const glm::quat& b, float epsilon) {
  return std::abs(std::abs(glm::dot(a, b)) - 1.f) <= epsilon;
}

};  // namespace math
};  // namespace a2c
