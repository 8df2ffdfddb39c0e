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

#include "app/batch_job.hpp"

#include <stdexcept>
#include <utility>

namespace atelier {
auto BatchSnapshot::ToJSON() const -> nlohmann::json {
  nlohmann::json results = nlohmann::json::array();
  for (const auto& asset : results_) {
    results.push_back(asset.ToJSON());
  }
  return {{"id", id_},
          {"total", total_},
          {"completed", completed_},
          {"failed", failed_},
          {"results", results},
          {"errors", errors_},
          {"status", status_ == BatchStatus::COMPLETE ? "complete" : "processing"}};
}

BatchJob::BatchJob(job_id_t id, size_t total)
    : id_(std::move(id)), total_(total), status_(BatchStatus::PROCESSING) {
  FinishIfDone();
}

auto BatchJob::FinishIfDone() -> bool {
  if (status_ == BatchStatus::PROCESSING && completed_ + failed_ == total_) {
    status_ = BatchStatus::COMPLETE;
    done_cv_.notify_all();
    return true;
  }
  return false;
}

auto BatchJob::RecordSuccess(ImageAsset asset) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  if (completed_ + failed_ >= total_) {
    throw std::logic_error("BatchJob: " + id_ + " received more results than units");
  }
  ++completed_;
  results_.push_back(std::move(asset));
  return FinishIfDone();
}

auto BatchJob::RecordFailure(std::string error) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  if (completed_ + failed_ >= total_) {
    throw std::logic_error("BatchJob: " + id_ + " received more results than units");
  }
  ++failed_;
  errors_.push_back(std::move(error));
  return FinishIfDone();
}

auto BatchJob::Snapshot() const -> BatchSnapshot {
  std::lock_guard<std::mutex> lock(mtx_);
  return {id_, total_, completed_, failed_, results_, errors_, status_};
}

auto BatchJob::IsComplete() const -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  return status_ == BatchStatus::COMPLETE;
}

void BatchJob::WaitUntilComplete() const {
  std::unique_lock<std::mutex> lock(mtx_);
  done_cv_.wait(lock, [this] { return status_ == BatchStatus::COMPLETE; });
}
};  // namespace atelier
