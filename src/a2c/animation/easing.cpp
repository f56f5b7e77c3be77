// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include "a2c/animation/easing.h"

#include <cmath>
#include <stdexcept>
#include <string>

#include <glm/gtc/constants.hpp>

namespace a2c {
namespace anim {

float Ease(float x) {
  if (!(x >= 0.f && x <= 1.f)) {
    throw std::out_of_range("Ease: argument should be in the range [0, 1], got " +
                            std::to_string(x));
  }
  const double pi = glm::pi<double>();
  return static_cast<float>((1.0 + std::sin((x - 0.5) * pi)) / 2.0);
}

std::vector<float> EaseRange(int n) {
  if (n <= 0) {
    throw std::invalid_argument("EaseRange: sample count should be positive, got " +
                                std::to_string(n));
  }

  std::vector<float> output;
  output.reserve(n + 1);
  for (int i = 0; i <= n; i++) {
    output.push_back(Ease(static_cast<float>(i) / static_cast<float>(n)));
  }
  return output;
}

}  // namespace anim
}  // namespace a2c
