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

#include <exception>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "type/errors.hpp"

namespace atelier {
struct StrategyFailure {
  std::string name_;
  std::string message_;
};

template <typename T>
struct FallbackOutcome {
  std::optional<T>             value_;
  std::string                  winner_;
  std::vector<StrategyFailure> failures_;

  auto                         Succeeded() const -> bool { return value_.has_value(); }
};

/**
 * @brief An ordered list of named fallible strategies. Run() invokes them one at a time and
 *        stops at the first that returns; a strategy that throws is logged and the next one is
 *        tried. Nothing is retried and nothing runs concurrently.
 */
template <typename T>
class FallbackChain {
 private:
  std::vector<std::pair<std::string, std::function<T()>>> strategies_;

 public:
  auto Then(std::string name, std::function<T()> strategy) -> FallbackChain& {
    strategies_.emplace_back(std::move(name), std::move(strategy));
    return *this;
  }

  auto Size() const -> size_t { return strategies_.size(); }

  auto Run() const -> FallbackOutcome<T> {
    FallbackOutcome<T> outcome;
    for (const auto& [name, strategy] : strategies_) {
      try {
        outcome.value_  = strategy();
        outcome.winner_ = name;
        return outcome;
      } catch (const std::exception& e) {
        std::cerr << "[WARN] FallbackChain: " << name << " failed: " << e.what() << std::endl;
        outcome.failures_.push_back({name, e.what()});
      } catch (...) {
        std::cerr << "[WARN] FallbackChain: " << name << " failed with a non-standard exception"
                  << std::endl;
        outcome.failures_.push_back({name, "non-standard exception"});
      }
    }
    return outcome;
  }

  /**
   * @brief Run() that unwraps the value, or throws AllAdaptersFailed naming every attempt.
   */
  auto RunOrThrow() const -> std::pair<T, std::string> {
    auto outcome = Run();
    if (outcome.Succeeded()) {
      return {std::move(*outcome.value_), outcome.winner_};
    }
    std::vector<std::string> attempted;
    for (const auto& f : outcome.failures_) {
      attempted.push_back(f.name_);
    }
    std::string last =
        outcome.failures_.empty() ? "no strategies configured" : outcome.failures_.back().message_;
    throw AllAdaptersFailed(std::move(attempted), std::move(last));
  }
};
};  // namespace atelier
