// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_ENGINE_ALIGN_API_H
#define A2C_ENGINE_ALIGN_API_H

#include <memory>
#include <optional>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <a2c/scene/scene.h>
#include <a2c/scene/viewpoint.h>
#include <a2c/scene/viewport.h>

namespace a2c {
class Config;
class Aligner;

/**
 * @brief Outcome of an align request
 *
 * Only Applied and Started change the view; the others are silent no-ops
 * that a UI may treat as handled.
 */
enum class AlignStatus {
  /**Target orientation written at once*/
  Applied,
  /**Smooth rotation launched on the animator thread*/
  Started,
  /**A rotation is already running, request dropped*/
  Busy,
  /**The viewport is not a 3D view*/
  NotView3D,
  /**Custom source requested but the scene has no custom orientation*/
  NoCustomOrientation,
};

const char* ToString(AlignStatus status);

class AlignAPI {
 public:
  AlignAPI(Config config, std::shared_ptr<Viewport> viewport,
           std::shared_ptr<const Scene> scene);
  ~AlignAPI();

  AlignStatus Align(Viewpoint viewpoint, OrientationSource source);
  std::optional<glm::quat> TargetOrientation(Viewpoint viewpoint,
                                             OrientationSource source) const;

  bool Busy() const;
  void Wait();
  void Cancel();

 private:
  std::unique_ptr<Aligner> aligner_;
};

}  // namespace a2c

#endif  // A2C_ENGINE_ALIGN_API_H
