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

#include "lineage/lineage_graph.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "type/errors.hpp"
#include "type/hash_type.hpp"
#include "utils/clock/time_provider.hpp"

namespace atelier {
namespace {
auto ToLower(std::string s) -> std::string {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Records written before the ordering key existed carry created_at_ == 0 and only an ISO-8601
// creation time. They sort below every keyed record, by time, and were stored newest first.
auto NewerThan(const ImageAsset& a, size_t a_pos, const ImageAsset& b, size_t b_pos) -> bool {
  const bool a_keyed = a.created_at_ != 0;
  const bool b_keyed = b.created_at_ != 0;
  if (a_keyed != b_keyed) return a_keyed;
  if (a_keyed) {
    if (a.created_at_ != b.created_at_) return a.created_at_ > b.created_at_;
    return a_pos > b_pos;
  }
  if (a.created_time_ != b.created_time_) return a.created_time_ > b.created_time_;
  return a_pos < b_pos;
}
}  // namespace

auto HistoryView::ToJSON() const -> nlohmann::json {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& e : entries_) {
    entries.push_back({{"id", e.id_},
                       {"operation_kind", e.kind_},
                       {"created_time", e.created_time_},
                       {"params", e.params_}});
  }
  return {{"asset_id", asset_id_},
          {"entries", entries},
          {"current_index", current_index_},
          {"can_undo", can_undo_},
          {"can_redo", can_redo_}};
}

LineageGraph::LineageGraph(std::shared_ptr<RecordStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("LineageGraph: record store must not be null");
  }
  seq_t max_seq = 0;
  for (const auto& asset : Load()) {
    max_seq = std::max(max_seq, asset.created_at_);
  }
  seq_gen_.AdvanceTo(max_seq);
}

auto LineageGraph::Load() const -> std::vector<ImageAsset> {
  std::vector<ImageAsset> assets;
  auto                    records = store_->All();
  assets.reserve(records.size());
  for (const auto& record : records) {
    assets.push_back(ImageAsset::FromJSON(record));
  }
  return assets;
}

auto LineageGraph::Insert(ImageAsset asset) -> ImageAsset {
  if (asset.parent_id_.has_value() && !Find(*asset.parent_id_).has_value()) {
    throw AssetNotFound(*asset.parent_id_);
  }
  if (asset.id_.empty()) {
    asset.id_ = Hash128::Generate().ToString();
  }
  if (asset.created_at_ == 0) {
    asset.created_at_ = seq_gen_.GenerateID();
  } else {
    seq_gen_.AdvanceTo(asset.created_at_);
  }
  if (asset.created_time_.empty()) {
    asset.created_time_ = TimeProvider::ToISO8601(TimeProvider::Now());
  }
  if (asset.filename_.empty()) {
    asset.filename_ = asset.id_ + ".png";
  }
  store_->Append(asset.ToJSON());
  return asset;
}

auto LineageGraph::Find(const asset_id_t& id) const -> std::optional<ImageAsset> {
  for (const auto& record : store_->All()) {
    if (record.value("id", std::string()) == id) {
      return ImageAsset::FromJSON(record);
    }
  }
  return std::nullopt;
}

auto LineageGraph::Get(const asset_id_t& id) const -> ImageAsset {
  auto asset = Find(id);
  if (!asset.has_value()) {
    throw AssetNotFound(id);
  }
  return std::move(*asset);
}

auto LineageGraph::RootChain(const asset_id_t& id) const -> std::vector<ImageAsset> {
  auto                                    assets = Load();
  std::unordered_map<asset_id_t, size_t> index;
  for (size_t i = 0; i < assets.size(); ++i) {
    index.emplace(assets[i].id_, i);
  }
  auto it = index.find(id);
  if (it == index.end()) {
    throw AssetNotFound(id);
  }

  std::vector<ImageAsset>        chain;
  std::unordered_set<asset_id_t> visited;
  const ImageAsset*              current = &assets[it->second];
  while (current && visited.insert(current->id_).second) {
    chain.push_back(*current);
    if (!current->parent_id_.has_value()) break;
    auto parent = index.find(*current->parent_id_);
    current     = parent == index.end() ? nullptr : &assets[parent->second];
  }
  std::reverse(chain.begin(), chain.end());
  return chain;
}

auto LineageGraph::Children(const asset_id_t& id) const -> std::vector<ImageAsset> {
  std::vector<ImageAsset> children;
  for (auto& asset : Load()) {
    if (asset.parent_id_.has_value() && *asset.parent_id_ == id) {
      children.push_back(std::move(asset));
    }
  }
  return children;
}

auto LineageGraph::Undo(const asset_id_t& id) const -> ImageAsset {
  auto asset = Get(id);
  if (!asset.parent_id_.has_value()) {
    throw NothingToUndo(id);
  }
  return Get(*asset.parent_id_);
}

auto LineageGraph::Redo(const asset_id_t& id) const -> ImageAsset {
  Get(id);
  auto children = Children(id);
  if (children.empty()) {
    throw NothingToRedo(id);
  }
  // Children keep store order, so positions stand in for store positions
  size_t latest = 0;
  for (size_t i = 1; i < children.size(); ++i) {
    if (NewerThan(children[i], i, children[latest], latest)) {
      latest = i;
    }
  }
  return std::move(children[latest]);
}

auto LineageGraph::History(const asset_id_t& id) const -> HistoryView {
  auto        chain = RootChain(id);
  HistoryView view;
  view.asset_id_ = id;
  for (const auto& asset : chain) {
    view.entries_.push_back({asset.id_, std::string(OperationKindToString(asset.kind_)),
                             asset.created_time_, PayloadToJSON(asset.payload_)});
  }
  view.current_index_ = view.entries_.empty() ? 0 : view.entries_.size() - 1;
  view.can_undo_      = chain.back().parent_id_.has_value();
  view.can_redo_      = !Children(id).empty();
  return view;
}

auto LineageGraph::ToggleFavorite(const asset_id_t& id) -> bool {
  bool flag  = false;
  bool found = store_->Update(id, [&flag](nlohmann::json& record) {
    flag                  = !record.value("favorited", false);
    record["favorited"] = flag;
  });
  if (!found) {
    throw AssetNotFound(id);
  }
  return flag;
}

auto LineageGraph::List(size_t page, size_t limit, const std::string& search,
                        bool favorites_only) const -> AssetPage {
  if (page == 0 || limit == 0) {
    throw ValidationError("page and limit must be positive");
  }
  auto              assets = Load();
  const std::string needle = ToLower(search);

  std::vector<std::pair<size_t, ImageAsset*>> matched;
  for (size_t i = 0; i < assets.size(); ++i) {
    if (favorites_only && !assets[i].favorited_) continue;
    if (!needle.empty() && ToLower(assets[i].prompt_).find(needle) == std::string::npos) continue;
    matched.emplace_back(i, &assets[i]);
  }
  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
    return NewerThan(*a.second, a.first, *b.second, b.first);
  });

  AssetPage result;
  result.total_ = matched.size();
  result.page_  = page;
  result.limit_ = limit;
  const size_t begin = (page - 1) * limit;
  if (begin < matched.size()) {
    const size_t end = std::min(begin + limit, matched.size());
    for (size_t i = begin; i < end; ++i) {
      result.items_.push_back(std::move(*matched[i].second));
    }
  }
  return result;
}
};  // namespace atelier
