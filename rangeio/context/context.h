//
// Copyright (C) 2026 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "rangeio/result/result_type.h"

namespace rangeio {

/**
 * Cancellation scope for operations against an object store.
 *
 * Copies share state: cancelling any copy cancels all of them, and every
 * context derived from them through `WithCancel` or `WithTimeout`. A child
 * never cancels its parent.
 */
class Context {
 public:
  using Clock = std::chrono::steady_clock;

  // A root context, cancelled only through `Cancel`.
  Context();

  Context WithCancel() const;
  Context WithTimeout(std::chrono::milliseconds timeout) const;

  // Safe to call from any thread.
  void Cancel() const;

  bool IsCancelled() const;

  // Fails once the context is cancelled or its deadline passed.
  Result<void> Err() const;

 private:
  struct State {
    std::atomic_bool cancelled = false;
    std::optional<Clock::time_point> deadline;
    std::shared_ptr<const State> parent;
  };

  explicit Context(std::shared_ptr<State> state);

  std::shared_ptr<State> state_;
};

}  // namespace rangeio
