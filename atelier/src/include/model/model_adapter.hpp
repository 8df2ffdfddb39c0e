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

#pragma once

#include <optional>
#include <string>

#include "type/type.hpp"

namespace atelier {
struct GenerationRequest {
  std::string prompt_;
  ImageSize   size_{1024, 1024};
};

struct EditRequest {
  raster_bytes_t                source_;
  std::optional<raster_bytes_t> mask_;
  std::string                   prompt_;
  ImageSize                     size_{1024, 1024};

  auto WithoutMask() const -> EditRequest {
    EditRequest copy = *this;
    copy.mask_.reset();
    return copy;
  }
};

/**
 * @brief A generative image backend. Both calls return encoded raster bytes and may throw
 *        on any failure; callers treat every exception as retryable on the next backend.
 */
class ModelAdapter {
 public:
  virtual ~ModelAdapter()                                           = default;

  virtual auto Name() const -> std::string                          = 0;
  virtual auto Synthesize(const GenerationRequest& request) -> raster_bytes_t = 0;
  virtual auto Edit(const EditRequest& request) -> raster_bytes_t   = 0;
};

/**
 * @brief Optional collaborator that strips the background of a raster, returning BGRA bytes.
 */
class BackgroundRemover {
 public:
  virtual ~BackgroundRemover()                                   = default;
  virtual auto Remove(const raster_bytes_t& source) -> raster_bytes_t = 0;
};
};  // namespace atelier
