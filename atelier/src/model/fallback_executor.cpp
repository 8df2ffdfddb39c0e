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

#include "model/fallback_executor.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "type/errors.hpp"

namespace atelier {
namespace {
auto Unwrap(const FallbackChain<raster_bytes_t>& chain) -> AdapterResult {
  auto [bytes, winner] = chain.RunOrThrow();
  return {std::move(bytes), std::move(winner)};
}
}  // namespace

FallbackExecutor::FallbackExecutor(std::vector<std::shared_ptr<ModelAdapter>> adapters)
    : adapters_(std::move(adapters)) {
  adapters_.erase(std::remove(adapters_.begin(), adapters_.end(), nullptr), adapters_.end());
}

auto FallbackExecutor::AdapterNames() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(adapters_.size());
  for (const auto& adapter : adapters_) {
    names.push_back(adapter->Name());
  }
  return names;
}

auto FallbackExecutor::HasAdapter(const std::string& name) const -> bool {
  return std::any_of(adapters_.begin(), adapters_.end(),
                     [&](const auto& adapter) { return adapter->Name() == name; });
}

auto FallbackExecutor::OrderFor(const std::optional<std::string>& preferred) const
    -> std::vector<std::shared_ptr<ModelAdapter>> {
  if (!preferred.has_value() || preferred->empty()) {
    return adapters_;
  }
  auto it = std::find_if(adapters_.begin(), adapters_.end(),
                         [&](const auto& adapter) { return adapter->Name() == *preferred; });
  if (it == adapters_.end()) {
    std::cerr << "[WARN] FallbackExecutor: Unknown preferred adapter '" << *preferred
              << "', using configured order" << std::endl;
    return adapters_;
  }
  std::vector<std::shared_ptr<ModelAdapter>> ordered;
  ordered.reserve(adapters_.size());
  ordered.push_back(*it);
  for (const auto& adapter : adapters_) {
    if (adapter != *it) {
      ordered.push_back(adapter);
    }
  }
  return ordered;
}

auto FallbackExecutor::Synthesize(const GenerationRequest&          request,
                                  const std::optional<std::string>& preferred) const
    -> AdapterResult {
  FallbackChain<raster_bytes_t> chain;
  for (const auto& adapter : OrderFor(preferred)) {
    chain.Then(adapter->Name(), [adapter, &request]() { return adapter->Synthesize(request); });
  }
  return Unwrap(chain);
}

auto FallbackExecutor::Edit(const EditRequest&                request,
                            const std::optional<std::string>& preferred) const -> AdapterResult {
  FallbackChain<raster_bytes_t> chain;
  for (const auto& adapter : OrderFor(preferred)) {
    chain.Then(adapter->Name(), [adapter, &request]() { return adapter->Edit(request); });
  }
  return Unwrap(chain);
}

auto FallbackExecutor::EditOrSynthesize(const EditRequest& request, const std::string& synth_prompt,
                                        const std::optional<std::string>& preferred) const
    -> AdapterResult {
  const auto                    ordered = OrderFor(preferred);
  GenerationRequest             text_only{synth_prompt, request.size_};
  FallbackChain<raster_bytes_t> chain;
  for (const auto& adapter : ordered) {
    chain.Then(adapter->Name(), [adapter, &request]() { return adapter->Edit(request); });
  }
  for (const auto& adapter : ordered) {
    chain.Then(adapter->Name(),
               [adapter, &text_only]() { return adapter->Synthesize(text_only); });
  }
  return Unwrap(chain);
}

auto FallbackExecutor::EditChain(const EditRequest&                request,
                                 const std::optional<std::string>& preferred) const
    -> AdapterResult {
  const auto ordered = OrderFor(preferred);
  if (ordered.empty()) {
    throw AllAdaptersFailed({}, "no adapters configured");
  }
  const auto&                   lead       = ordered.front();
  EditRequest                   unmasked   = request.WithoutMask();
  GenerationRequest             regenerate{request.prompt_ + kBlendSuffix, request.size_};

  FallbackChain<raster_bytes_t> chain;
  if (request.mask_.has_value()) {
    chain.Then(lead->Name(), [lead, &request]() { return lead->Edit(request); });
  }
  chain.Then(lead->Name(), [lead, &unmasked]() { return lead->Edit(unmasked); });
  for (const auto& adapter : ordered) {
    chain.Then(adapter->Name(),
               [adapter, &regenerate]() { return adapter->Synthesize(regenerate); });
  }
  return Unwrap(chain);
}
};  // namespace atelier
