// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_SCENE_VIEWPORT_CAMERA_H
#define A2C_SCENE_VIEWPORT_CAMERA_H

#include <cstdint>
#include <functional>
#include <mutex>

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtx/quaternion.hpp>

#include "a2c/scene/viewport.h"

namespace a2c {

/**
 * @brief 3D view camera orbiting a center point
 *
 * camera = center + distance * (orientation * +Z), looking along -Z of the
 * orientation frame. Identity orientation looks down onto the XY plane.
 */
class ViewportCamera : public Viewport {
 public:
  using OrientationCallback = std::function<void(const glm::quat&)>;

  ViewportCamera();
  explicit ViewportCamera(ViewType type);
  ~ViewportCamera();

  ViewType Type() const override { return type_; }

  glm::quat Orientation() const override;
  void SetOrientation(const glm::quat& orientation) override;

  Projection projection() const override;
  void SetProjection(Projection projection) override;

  /** Called after every orientation write, on the writing thread */
  void SetOrientationCallback(OrientationCallback callback);

  void SetWindowSize(uint32_t width, uint32_t height);

  glm::mat4 ViewMatrix() const;
  glm::mat4 ProjectionMatrix() const;
  glm::vec3 Eye() const;

  glm::vec3& center(const glm::vec3& c);
  float distance(float d);

  float Near() const noexcept { return near_; }
  float Far() const noexcept { return far_; }
  uint32_t width() const noexcept { return width_; }
  uint32_t height() const noexcept { return height_; }

 private:
  ViewType type_ = ViewType::View3D;

  mutable std::mutex mutex_;
  glm::quat quat_ = glm::quat(1.f, 0.f, 0.f, 0.f);
  Projection projection_ = Projection::Perspective;
  OrientationCallback callback_;

  glm::vec3 center_ = {0.f, 0.f, 0.f};
  float distance_ = 10.f;

  uint32_t width_ = 1920;
  uint32_t height_ = 1080;
  float fovy_ = glm::radians(50.f);
  float near_ = 0.01f;
  float far_ = 1000.f;
};

}  // namespace a2c

#endif  // A2C_SCENE_VIEWPORT_CAMERA_H
