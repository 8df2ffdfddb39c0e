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

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace atelier {
/**
 * @brief Runtime settings of a StudioService, persisted as a JSON document.
 */
struct StudioConfig {
  file_path_t              images_dir_   = "images";
  // Empty selects the in-memory record store
  file_path_t              db_path_;
  // Empty selects an in-memory prompt history; must differ from db_path_
  file_path_t              prompt_db_path_;
  size_t                   worker_count_ = 4;
  std::vector<std::string> adapter_order_;
  int                      gif_max_edge_ = 512;
  std::vector<ImageSize>   valid_sizes_  = {{1024, 1024}, {1024, 1536}, {1536, 1024}};
  std::string              default_style_ = "none";

  auto                     IsValidSize(const ImageSize& size) const -> bool;

  auto                     ToJSON() const -> nlohmann::json;
  void                     FromJSON(const nlohmann::json& j);

  /**
   * @brief Defaults when the file does not exist. Throws ValidationError when it exists but
   *        is not a valid config document.
   */
  static auto              Load(const std::filesystem::path& path) -> StudioConfig;
  void                     Save(const std::filesystem::path& path) const;
};
};  // namespace atelier
