// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include <a2c/scene/viewport_camera.h>

#include <algorithm>
#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

namespace a2c {

ViewportCamera::ViewportCamera() {}

ViewportCamera::ViewportCamera(ViewType type) : type_(type) {}

ViewportCamera::~ViewportCamera() {}

glm::quat ViewportCamera::Orientation() const {
  std::unique_lock<std::mutex> guard{mutex_};
  return quat_;
}

void ViewportCamera::SetOrientation(const glm::quat& orientation) {
  OrientationCallback callback;
  {
    std::unique_lock<std::mutex> guard{mutex_};
    quat_ = glm::normalize(orientation);
    callback = callback_;
  }
  if (callback) {
    callback(orientation);
  }
}

Projection ViewportCamera::projection() const {
  std::unique_lock<std::mutex> guard{mutex_};
  return projection_;
}

void ViewportCamera::SetProjection(Projection projection) {
  std::unique_lock<std::mutex> guard{mutex_};
  projection_ = projection;
}

void ViewportCamera::SetOrientationCallback(OrientationCallback callback) {
  std::unique_lock<std::mutex> guard{mutex_};
  callback_ = std::move(callback);
}

void ViewportCamera::SetWindowSize(uint32_t width, uint32_t height) {
  width_ = width;
  height_ = height;
}

glm::vec3& ViewportCamera::center(const glm::vec3& c) {
  center_ = c;
  return center_;
}

float ViewportCamera::distance(float d) {
  distance_ = std::max(d, near_);
  return distance_;
}

glm::vec3 ViewportCamera::Eye() const {
  return center_ + Orientation() * glm::vec3(0.f, 0.f, distance_);
}

glm::mat4 ViewportCamera::ViewMatrix() const {
  glm::mat4 mat_translation(1);
  mat_translation = glm::translate(mat_translation, Eye());
  auto mat_rotation = glm::toMat4(Orientation());
  return glm::inverse(mat_translation * mat_rotation);
}

glm::mat4 ViewportCamera::ProjectionMatrix() const {
  const float aspect = height_ > 0 ? static_cast<float>(width_) / height_ : 1.f;

  glm::mat4 mat_projection;
  if (projection() == Projection::Orthographic) {
    // keep the perspective framing at the orbit center
    const float half_height = distance_ * std::tan(fovy_ / 2.f);
    const float half_width = half_height * aspect;
    mat_projection = glm::ortho(-half_width, half_width, -half_height, half_height,
                            -far_, far_);
  } else {
    mat_projection = glm::perspective(fovy_, aspect, near_, far_);
  }

  // gl to vulkan projection matrix
  glm::mat4 conversion = glm::mat4(1.f);
  conversion[1][1] = -1.f;
  conversion[2][2] = 0.5f;
  conversion[3][2] = 0.5f;
  return conversion * mat_projection;
}

}  // namespace a2c
