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

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "lineage/image_asset.hpp"
#include "storage/store/record_store.hpp"
#include "utils/id/id_generator.hpp"

namespace atelier {
struct HistoryEntry {
  asset_id_t     id_;
  std::string    kind_;
  std::string    created_time_;
  nlohmann::json params_;
};

/**
 * @brief The root-to-asset chain of one asset, with its undo/redo availability.
 */
struct HistoryView {
  asset_id_t                asset_id_;
  std::vector<HistoryEntry> entries_;
  size_t                    current_index_ = 0;
  bool                      can_undo_      = false;
  bool                      can_redo_      = false;

  auto                      ToJSON() const -> nlohmann::json;
};

struct AssetPage {
  std::vector<ImageAsset> items_;
  size_t                  total_ = 0;
  size_t                  page_  = 1;
  size_t                  limit_ = 50;
};

/**
 * @brief Parent/child graph over the records of a RecordStore.
 *
 * Insertion only accepts parents that already exist, so the graph stays acyclic. Walks that
 * reach a missing parent stop there instead of failing.
 */
class LineageGraph {
 private:
  std::shared_ptr<RecordStore>      store_;
  IncrID::AtomicIDGenerator<seq_t>  seq_gen_{0};

  auto                              Load() const -> std::vector<ImageAsset>;

 public:
  explicit LineageGraph(std::shared_ptr<RecordStore> store);

  /**
   * @brief Store the asset. Fills in a fresh id, the ordering key and the creation time when
   *        they are unset. Throws AssetNotFound when parent_id_ names no stored asset.
   */
  auto Insert(ImageAsset asset) -> ImageAsset;

  auto Find(const asset_id_t& id) const -> std::optional<ImageAsset>;
  auto Get(const asset_id_t& id) const -> ImageAsset;

  /**
   * @brief Ancestors of id followed by id itself, oldest first.
   */
  auto RootChain(const asset_id_t& id) const -> std::vector<ImageAsset>;
  auto Children(const asset_id_t& id) const -> std::vector<ImageAsset>;

  auto Undo(const asset_id_t& id) const -> ImageAsset;
  /**
   * @brief Most recently created child. Ties on the ordering key go to the later record.
   *        Unkeyed legacy records are older than any keyed one and compare by creation time.
   */
  auto Redo(const asset_id_t& id) const -> ImageAsset;
  auto History(const asset_id_t& id) const -> HistoryView;

  auto ToggleFavorite(const asset_id_t& id) -> bool;

  /**
   * @brief Newest-first page. page is 1-based; search is a case-insensitive substring of the
   *        prompt.
   */
  auto List(size_t page, size_t limit, const std::string& search = "",
            bool favorites_only = false) const -> AssetPage;
};
};  // namespace atelier
