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
#include <chrono>
#include <string>

namespace atelier {
/**
 * @brief Process-wide clock. Wall time is derived from a cached system time plus elapsed
 *        steady time, so timestamps taken within one run never go backwards.
 */
class TimeProvider {
 private:
  static std::atomic<std::chrono::system_clock::time_point> _cached_sys_time;
  static std::atomic<std::chrono::steady_clock::time_point> _cached_steady_time;

 public:
  static void Refresh();
  static auto Now() -> std::chrono::system_clock::time_point;
  static auto TimePointToString(const std::chrono::system_clock::time_point& tp) -> std::string;
  /**
   * @brief UTC ISO-8601 rendering with microseconds, e.g. 2025-03-19T08:15:02.123456
   */
  static auto ToISO8601(const std::chrono::system_clock::time_point& tp) -> std::string;
};
};  // namespace atelier
