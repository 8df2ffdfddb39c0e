//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "type/errors.hpp"

#include <string>
#include <utility>
#include <vector>

#include "type/type.hpp"

namespace atelier {
namespace {
auto Join(const std::vector<std::string>& parts, const std::string& sep) -> std::string {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}
}  // namespace

AllAdaptersFailed::AllAdaptersFailed(std::vector<std::string> attempted, std::string last_error)
    : StudioError("All adapters failed [" + Join(attempted, ", ") + "]. Last error: " +
                  last_error),
      attempted_(std::move(attempted)),
      last_error_(std::move(last_error)) {}

BatchFailed::BatchFailed(std::vector<std::string> errors)
    : StudioError("All generations failed: " + Join(errors, "; ")), errors_(std::move(errors)) {}

auto ParseImageSize(const std::string& text) -> ImageSize {
  auto pos = text.find('x');
  if (pos == std::string::npos || pos == 0 || pos + 1 >= text.size()) {
    throw ValidationError("size '" + text + "' is not of the form WxH");
  }
  ImageSize size;
  try {
    size_t consumed_w = 0;
    size_t consumed_h = 0;
    size.width_       = std::stoi(text.substr(0, pos), &consumed_w);
    size.height_      = std::stoi(text.substr(pos + 1), &consumed_h);
    if (consumed_w != pos || consumed_h != text.size() - pos - 1) {
      throw ValidationError("size '" + text + "' has trailing characters");
    }
  } catch (const std::logic_error&) {
    throw ValidationError("size '" + text + "' is not numeric");
  }
  if (size.width_ <= 0 || size.height_ <= 0) {
    throw ValidationError("size '" + text + "' must be positive");
  }
  return size;
}
};  // namespace atelier
