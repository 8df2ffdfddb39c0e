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

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/batch_job.hpp"
#include "concurrency/thread_pool.hpp"
#include "lineage/image_asset.hpp"

namespace atelier {
/**
 * @brief One independent generation. Returns the stored asset or throws.
 */
using BatchUnit = std::function<ImageAsset()>;

struct BatchOutcome {
  std::vector<ImageAsset>  assets_;
  std::vector<std::string> errors_;

  auto                     PartiallyFailed() const -> bool { return !errors_.empty(); }
};

class BatchCoordinator {
 private:
  std::mutex                                            registry_mutex_;
  std::unordered_map<job_id_t, std::shared_ptr<BatchJob>> jobs_;

  // Declared last so queued units finish before the registry goes away
  ThreadPool                                            pool_;

  auto FindJob(const job_id_t& id) -> std::shared_ptr<BatchJob>;

 public:
  static constexpr size_t kMaxWorkers = 4;

  explicit BatchCoordinator(size_t worker_count);

  BatchCoordinator(const BatchCoordinator&)            = delete;
  BatchCoordinator& operator=(const BatchCoordinator&) = delete;

  /**
   * @brief Run every unit on the pool and wait for all of them. A failing unit never stops
   *        its siblings. Throws BatchFailed only when no unit succeeded.
   */
  auto RunAll(std::vector<BatchUnit> units) -> BatchOutcome;

  /**
   * @brief Register a job in processing state and run its units in the background. A fresh
   *        id is generated when id is empty.
   */
  auto Submit(std::vector<BatchUnit> units, job_id_t id = {}) -> job_id_t;

  auto Query(const job_id_t& id) -> BatchSnapshot;
  auto Await(const job_id_t& id) -> BatchSnapshot;
  /**
   * @brief Drop a finished job from the registry. Returns false while it is still running.
   */
  auto Expire(const job_id_t& id) -> bool;
  auto JobCount() -> size_t;
};
};  // namespace atelier
