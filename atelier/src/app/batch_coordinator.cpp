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

#include "app/batch_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <utility>

#include "type/errors.hpp"
#include "type/hash_type.hpp"

namespace atelier {
BatchCoordinator::BatchCoordinator(size_t worker_count)
    : pool_(std::clamp<size_t>(worker_count, 1, kMaxWorkers)) {}

auto BatchCoordinator::RunAll(std::vector<BatchUnit> units) -> BatchOutcome {
  std::vector<std::future<ImageAsset>> futures;
  futures.reserve(units.size());
  for (auto& unit : units) {
    futures.push_back(pool_.SubmitTask(std::move(unit)));
  }

  BatchOutcome outcome;
  for (size_t i = 0; i < futures.size(); ++i) {
    try {
      outcome.assets_.push_back(futures[i].get());
    } catch (const std::exception& e) {
      std::cerr << "[ERROR] BatchCoordinator: Unit " << i << " failed: " << e.what()
                << std::endl;
      outcome.errors_.emplace_back(e.what());
    } catch (...) {
      std::cerr << "[ERROR] BatchCoordinator: Unit " << i
                << " failed with a non-standard exception" << std::endl;
      outcome.errors_.emplace_back("Unknown batch unit error");
    }
  }
  if (outcome.assets_.empty() && !outcome.errors_.empty()) {
    throw BatchFailed(std::move(outcome.errors_));
  }
  return outcome;
}

auto BatchCoordinator::Submit(std::vector<BatchUnit> units, job_id_t id) -> job_id_t {
  if (id.empty()) {
    id = Hash128::Generate().ToString();
  }
  auto job = std::make_shared<BatchJob>(std::move(id), units.size());
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (!jobs_.emplace(job->GetId(), job).second) {
      throw ValidationError("batch job id already registered: " + job->GetId());
    }
  }

  for (size_t i = 0; i < units.size(); ++i) {
    pool_.Submit([job, unit = std::move(units[i]), i]() {
      bool finished = false;
      try {
        finished = job->RecordSuccess(unit());
      } catch (const std::exception& e) {
        std::cerr << "[ERROR] BatchCoordinator: Job " << job->GetId() << " unit " << i
                  << " failed: " << e.what() << std::endl;
        finished = job->RecordFailure(e.what());
      } catch (...) {
        std::cerr << "[ERROR] BatchCoordinator: Job " << job->GetId() << " unit " << i
                  << " failed with a non-standard exception" << std::endl;
        finished = job->RecordFailure("Unknown batch unit error");
      }
      if (finished) {
        auto snapshot = job->Snapshot();
        std::cout << "BatchCoordinator: Job " << snapshot.id_ << " complete, "
                  << snapshot.completed_ << "/" << snapshot.total_ << " succeeded"
                  << std::endl;
      }
    });
  }
  return job->GetId();
}

auto BatchCoordinator::FindJob(const job_id_t& id) -> std::shared_ptr<BatchJob> {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto                        it = jobs_.find(id);
  if (it == jobs_.end()) {
    throw AssetNotFound(id);
  }
  return it->second;
}

auto BatchCoordinator::Query(const job_id_t& id) -> BatchSnapshot { return FindJob(id)->Snapshot(); }

auto BatchCoordinator::Await(const job_id_t& id) -> BatchSnapshot {
  auto job = FindJob(id);
  job->WaitUntilComplete();
  return job->Snapshot();
}

auto BatchCoordinator::Expire(const job_id_t& id) -> bool {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto                        it = jobs_.find(id);
  if (it == jobs_.end()) {
    throw AssetNotFound(id);
  }
  if (!it->second->IsComplete()) {
    return false;
  }
  jobs_.erase(it);
  return true;
}

auto BatchCoordinator::JobCount() -> size_t {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return jobs_.size();
}
};  // namespace atelier
