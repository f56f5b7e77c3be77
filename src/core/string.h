// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#ifndef A2C_CORE_STRING_H
#define A2C_CORE_STRING_H

#include <string>
#include <sstream>
#include <vector>

namespace a2c {
namespace str {

std::string to_lower(std::string text);
std::string join(const std::vector<std::string>& list, const std::string& separator);

};
};  // namespace

#endif  // A2C_CORE_STRING_H
