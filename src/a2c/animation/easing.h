// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_ANIMATION_EASING_H
#define A2C_ANIMATION_EASING_H

#include <vector>

namespace a2c {
namespace anim {

/**
 * @brief Sine S-curve easing, slow at both ends
 * @param x linear progress, in [0, 1]
 * @return eased progress, in [0, 1]
 * @throws std::out_of_range when x is outside [0, 1]
 */
float Ease(float x);

/**
 * @brief Eased progress values at evenly spaced inputs 0, 1/n, ..., 1
 * @param n number of intervals, must be positive
 * @return n + 1 values, first is 0 and last is 1
 * @throws std::invalid_argument when n <= 0
 */
std::vector<float> EaseRange(int n);

}  // namespace anim
}  // namespace a2c

#endif  // A2C_ANIMATION_EASING_H
