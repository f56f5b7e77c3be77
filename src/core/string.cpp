// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include "core/string.h"

#include <cctype>

namespace a2c {
namespace str {

/**
 * @brief Convert string to lowercase
 * @param text input strings
 * @return lowercase string
 */
std::string to_lower(std::string text) {
  std::string output = "";
  for (char& c : text) {
    output += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return output;
}

/**
 * @brief Join strings with a separator
 * @param list vector of strings
 * @param separator inserted between two consecutive strings
 * @return joined string
 */
std::string join(const std::vector<std::string>& list,
                 const std::string& separator) {
  std::stringstream stream;
  for (size_t i = 0; i < list.size(); i++) {
    if (i > 0) {
      stream << separator;
    }
    stream << list[i];
  }
  return stream.str();
}

};
};  // namespace
