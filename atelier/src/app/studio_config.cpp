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

#include "app/studio_config.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "type/errors.hpp"

namespace atelier {
auto StudioConfig::IsValidSize(const ImageSize& size) const -> bool {
  return std::find(valid_sizes_.begin(), valid_sizes_.end(), size) != valid_sizes_.end();
}

auto StudioConfig::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["images_dir"]     = images_dir_.string();
  j["db_path"]        = db_path_.string();
  j["prompt_db_path"] = prompt_db_path_.string();
  j["worker_count"]   = worker_count_;
  j["adapter_order"]  = adapter_order_;
  j["gif_max_edge"]   = gif_max_edge_;
  nlohmann::json sizes = nlohmann::json::array();
  for (const auto& size : valid_sizes_) {
    sizes.push_back(size.ToString());
  }
  j["valid_sizes"]   = sizes;
  j["default_style"] = default_style_;
  return j;
}

void StudioConfig::FromJSON(const nlohmann::json& j) {
  StudioConfig defaults;
  images_dir_     = j.value("images_dir", defaults.images_dir_.string());
  db_path_        = j.value("db_path", defaults.db_path_.string());
  prompt_db_path_ = j.value("prompt_db_path", defaults.prompt_db_path_.string());
  worker_count_   = std::clamp<size_t>(j.value("worker_count", defaults.worker_count_), 1, 4);
  adapter_order_  = j.value("adapter_order", defaults.adapter_order_);
  gif_max_edge_   = j.value("gif_max_edge", defaults.gif_max_edge_);
  default_style_  = j.value("default_style", defaults.default_style_);
  if (j.contains("valid_sizes")) {
    valid_sizes_.clear();
    for (const auto& entry : j.at("valid_sizes")) {
      valid_sizes_.push_back(ParseImageSize(entry.get<std::string>()));
    }
  } else {
    valid_sizes_ = defaults.valid_sizes_;
  }
  if (gif_max_edge_ <= 0) {
    throw ValidationError("gif_max_edge must be positive");
  }
  if (!db_path_.empty() && db_path_ == prompt_db_path_) {
    throw ValidationError("prompt_db_path must differ from db_path");
  }
}

auto StudioConfig::Load(const std::filesystem::path& path) -> StudioConfig {
  StudioConfig config;
  if (!std::filesystem::exists(path)) {
    return config;
  }
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("StudioConfig: Failed to open config file for reading");
  }
  try {
    nlohmann::json j;
    file >> j;
    if (!j.is_object()) {
      throw ValidationError("config root must be an object");
    }
    config.FromJSON(j);
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError(std::string("malformed config ") + path.string() + ": " + e.what());
  }
  return config;
}

void StudioConfig::Save(const std::filesystem::path& path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("StudioConfig: Failed to open config file for writing");
  }
  file << ToJSON().dump(4);
  file.close();
}
};  // namespace atelier
