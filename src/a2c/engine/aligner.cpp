// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include "a2c/engine/aligner.h"

#include <cstdio>
#include <stdexcept>

#include "a2c/engine/utils/math.h"

namespace a2c {

Aligner::Aligner(Config config, std::shared_ptr<Viewport> viewport,
                 std::shared_ptr<const Scene> scene)
    : config_(config), viewport_(std::move(viewport)), scene_(std::move(scene)) {
  if (!viewport_ || !scene_) {
    throw std::invalid_argument("Aligner needs a viewport and a scene");
  }
}

Aligner::~Aligner() = default;

std::optional<glm::quat> Aligner::TargetOrientation(
    Viewpoint viewpoint, OrientationSource source) const {
  glm::mat3 source_matrix;
  if (source == OrientationSource::Cursor) {
    source_matrix = scene_->CursorOrientation();
  } else {
    auto custom = scene_->CustomOrientation();
    if (!custom) {
      return std::nullopt;
    }
    source_matrix = *custom;
  }
  return math::ToQuaternion(TargetMatrix(source_matrix, viewpoint));
}

AlignStatus Aligner::Align(Viewpoint viewpoint, OrientationSource source) {
  if (manager_.Busy()) {
    if (config_.debug()) {
      printf("[a2c] align %s/%s dropped: rotation in progress\n",
             ToString(viewpoint), ToString(source));
    }
    return AlignStatus::Busy;
  }

  if (viewport_->Type() != ViewType::View3D) {
    return AlignStatus::NotView3D;
  }

  auto target = TargetOrientation(viewpoint, source);
  if (!target) {
    if (config_.debug()) {
      printf("[a2c] align %s/%s ignored: no custom orientation\n",
             ToString(viewpoint), ToString(source));
    }
    return AlignStatus::NoCustomOrientation;
  }

  if (!config_.smooth()) {
    viewport_->SetProjection(Projection::Orthographic);
    viewport_->SetOrientation(*target);
    return AlignStatus::Applied;
  }

  if (!manager_.TryAcquire()) {
    return AlignStatus::Busy;
  }

  viewport_->SetProjection(Projection::Orthographic);

  anim::AnimationRequest request{viewport_->Orientation(), *target};
  if (config_.debug()) {
    printf("[a2c] align %s/%s: %s rotation of %.1f deg\n", ToString(viewpoint),
           ToString(source), ToString(config_.strategy()),
           glm::degrees(math::AngleBetween(request.start, request.end)));
  }

  manager_.Start(anim::RotationAnimator(config_.animation_params()), request,
                 viewport_);
  return AlignStatus::Started;
}

const char* ToString(AlignStatus status) {
  switch (status) {
    case AlignStatus::Applied: return "applied";
    case AlignStatus::Started: return "started";
    case AlignStatus::Busy: return "busy";
    case AlignStatus::NotView3D: return "not a 3D view";
    case AlignStatus::NoCustomOrientation: return "no custom orientation";
  }
  return "unknown";
}

}  // namespace a2c
