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

#include <condition_variable>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "lineage/image_asset.hpp"
#include "type/type.hpp"

namespace atelier {
enum class BatchStatus { PROCESSING, COMPLETE };

struct BatchSnapshot {
  job_id_t                 id_;
  size_t                   total_     = 0;
  size_t                   completed_ = 0;
  size_t                   failed_    = 0;
  std::vector<ImageAsset>  results_;
  std::vector<std::string> errors_;
  BatchStatus              status_ = BatchStatus::PROCESSING;

  auto                     ToJSON() const -> nlohmann::json;
};

/**
 * @brief Shared record of one asynchronous batch. Every completion lands under the job mutex,
 *        so completed + failed never exceeds total and the status flips exactly once.
 */
class BatchJob {
 private:
  mutable std::mutex              mtx_;
  mutable std::condition_variable done_cv_;

  job_id_t                        id_;
  size_t                          total_;
  size_t                          completed_ = 0;
  size_t                          failed_    = 0;
  std::vector<ImageAsset>         results_;
  std::vector<std::string>        errors_;
  BatchStatus                     status_;

  auto                            FinishIfDone() -> bool;

 public:
  BatchJob(job_id_t id, size_t total);

  auto GetId() const -> const job_id_t& { return id_; }

  /**
   * @brief Both return true for the one call that completed the job.
   */
  auto RecordSuccess(ImageAsset asset) -> bool;
  auto RecordFailure(std::string error) -> bool;

  auto Snapshot() const -> BatchSnapshot;
  auto IsComplete() const -> bool;
  void WaitUntilComplete() const;
};
};  // namespace atelier
