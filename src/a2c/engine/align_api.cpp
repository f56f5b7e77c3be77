// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include <a2c/engine/align_api.h>

#include "a2c/engine/aligner.h"

namespace a2c {

AlignAPI::AlignAPI(Config config, std::shared_ptr<Viewport> viewport,
                   std::shared_ptr<const Scene> scene)
    : aligner_(std::make_unique<Aligner>(config, std::move(viewport),
                                         std::move(scene))) {}

AlignAPI::~AlignAPI() = default;

AlignStatus AlignAPI::Align(Viewpoint viewpoint, OrientationSource source) {
  return aligner_->Align(viewpoint, source);
}

std::optional<glm::quat> AlignAPI::TargetOrientation(
    Viewpoint viewpoint, OrientationSource source) const {
  return aligner_->TargetOrientation(viewpoint, source);
}

bool AlignAPI::Busy() const { return aligner_->Busy(); }

void AlignAPI::Wait() { aligner_->Wait(); }

void AlignAPI::Cancel() { aligner_->Cancel(); }

}  // namespace a2c
