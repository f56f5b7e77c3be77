// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include "a2c/engine/config.h"

#include <cmath>
#include <cstdio>

#include "yaml-cpp/yaml.h"

#include "core/string.h"

namespace a2c {

namespace {

float CheckSeconds(float seconds, const char* name, bool allow_zero) {
  if (seconds < 0.f || (!allow_zero && seconds == 0.f) || std::isnan(seconds)) {
    throw std::invalid_argument(std::string("invalid ") + name + ": " +
                                std::to_string(seconds));
  }
  return seconds;
}

}  // namespace

Config::Config() = default;

Config::Config(const std::string& filename, bool debug) {
  debug_ = debug;

  YAML::Node config;
  try {
    config = YAML::LoadFile(filename);
  } catch (const YAML::BadFile& e) {
    printf("Incorrect config file [.yaml] path: %s\n", filename.c_str());
    return;
  } catch (const YAML::ParserException& e) {
    throw std::invalid_argument("invalid config file " + filename + ": " + e.what());
  }

  try {
    if (config["smooth"]) {
      smooth_ = config["smooth"].as<bool>();
    }

    if (config["strategy"]) {
      strategy(config["strategy"].as<std::string>());
    }

    if (config["max_duration"]) {
      max_duration(config["max_duration"].as<float>());
    }

    if (config["step"]) {
      step(config["step"].as<float>());
    }

    if (config["max_frames"]) {
      max_frames(config["max_frames"].as<uint32_t>());
    }

    if (config["frame_delay"]) {
      frame_delay(config["frame_delay"].as<float>());
    }

    if (config["debug"]) {
      debug_ = debug_ || config["debug"].as<bool>();
    }
  } catch (const YAML::BadConversion& e) {
    throw std::invalid_argument("invalid config file " + filename + ": " + e.what());
  }
};

Config::~Config() = default;

bool Config::smooth() const { return smooth_; };
bool Config::smooth(bool enable) {
  smooth_ = enable;
  return smooth_;
};

anim::Strategy Config::strategy() const { return animation_params_.strategy; }
anim::Strategy Config::strategy(anim::Strategy strategy) {
  animation_params_.strategy = strategy;
  return animation_params_.strategy;
};
anim::Strategy Config::strategy(const std::string& strategy) {
  std::string strategy_lower = str::to_lower(strategy);

  if (strategy_lower == "duration") {
    animation_params_.strategy = anim::Strategy::Duration;
  } else if (strategy_lower == "frames" || strategy_lower == "frame_count") {
    animation_params_.strategy = anim::Strategy::FrameCount;
  } else {
    throw std::invalid_argument("invalid strategy: " + strategy);
  }
  return animation_params_.strategy;
};

float Config::max_duration() const { return animation_params_.max_duration; }
float Config::max_duration(float seconds) {
  animation_params_.max_duration = CheckSeconds(seconds, "max_duration", true);
  return animation_params_.max_duration;
};

float Config::step() const { return animation_params_.step; }
float Config::step(float seconds) {
  animation_params_.step = CheckSeconds(seconds, "step", false);
  return animation_params_.step;
};

uint32_t Config::max_frames() const { return animation_params_.max_frames; }
uint32_t Config::max_frames(uint32_t num_frames) {
  if (num_frames == 0) {
    throw std::invalid_argument("invalid max_frames: 0");
  }
  animation_params_.max_frames = num_frames;
  return animation_params_.max_frames;
};

float Config::frame_delay() const { return animation_params_.frame_delay; }
float Config::frame_delay(float seconds) {
  animation_params_.frame_delay = CheckSeconds(seconds, "frame_delay", true);
  return animation_params_.frame_delay;
};

bool Config::debug() const { return debug_; };
bool Config::debug(bool debug) {
  debug_ = debug;
  return debug_;
};

const anim::AnimationParams& Config::animation_params() const {
  return animation_params_;
}

const char* ToString(anim::Strategy strategy) {
  switch (strategy) {
    case anim::Strategy::Duration: return "duration";
    case anim::Strategy::FrameCount: return "frames";
  }
  return "unknown";
}

};  // namespace a2c
