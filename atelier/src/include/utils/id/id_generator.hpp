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

#include <atomic>
#include <concepts>
#include <cstdint>

namespace atelier {
namespace IncrID {
template <typename IDType>
concept Incrementable = requires(IDType t) {
  { ++t } -> std::same_as<IDType&>;
};
template <Incrementable T>
class IDGenerator {
 private:
  T _counter;

 public:
  IDGenerator(T start_id) : _counter(start_id) {}
  auto GenerateID() -> T { return ++_counter; }
  auto GetCurrentID() const -> T { return _counter; }
  void SetStartID(T start_id) { _counter = start_id; }
};

/**
 * @brief Lock-free variant for keys handed out from several worker threads at once.
 */
template <std::integral T>
class AtomicIDGenerator {
 private:
  std::atomic<T> _counter;

 public:
  AtomicIDGenerator(T start_id) : _counter(start_id) {}
  auto GenerateID() -> T { return _counter.fetch_add(1, std::memory_order_acq_rel) + 1; }
  auto GetCurrentID() const -> T { return _counter.load(std::memory_order_acquire); }
  // Only moves forward; a lower start id is ignored
  void AdvanceTo(T start_id) {
    T current = _counter.load(std::memory_order_acquire);
    while (current < start_id &&
           !_counter.compare_exchange_weak(current, start_id, std::memory_order_acq_rel)) {
    }
  }
};
};  // namespace IncrID
};  // namespace atelier
