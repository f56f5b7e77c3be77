// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_ENGINE_CONFIG_H
#define A2C_ENGINE_CONFIG_H

#include <cstdint>
#include <stdexcept>
#include <string>

#include "a2c/animation/rotation_animator.h"

/// \file

namespace a2c {

/**
 * @brief Configuration settings for Aligner
 */
class Config {
 public:
  Config();
  Config(const std::string& filename, bool debug = false);
  ~Config();

  bool smooth() const;
  bool smooth(bool enable);

  anim::Strategy strategy() const;
  anim::Strategy strategy(anim::Strategy strategy);
  anim::Strategy strategy(const std::string& strategy);

  float max_duration() const;
  float max_duration(float seconds);

  float step() const;
  float step(float seconds);

  uint32_t max_frames() const;
  uint32_t max_frames(uint32_t num_frames);

  float frame_delay() const;
  float frame_delay(float seconds);

  bool debug() const;
  bool debug(bool debug);

  const anim::AnimationParams& animation_params() const;

private:
  bool smooth_ = true;
  bool debug_ = false;

  // animation pacing
  anim::AnimationParams animation_params_;
};

const char* ToString(anim::Strategy strategy);

};  // namespace a2c

#endif  // A2C_ENGINE_CONFIG_H
