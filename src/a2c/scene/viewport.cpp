// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include <a2c/scene/viewport.h>

namespace a2c {

Viewport::Viewport() {}

Viewport::~Viewport() {}

}  // namespace a2c
