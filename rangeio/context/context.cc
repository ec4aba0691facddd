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

#include "rangeio/context/context.h"

#include <chrono>
#include <memory>
#include <utility>

#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

Context::Context() : state_(std::make_shared<State>()) {}

Context::Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

Context Context::WithCancel() const {
  auto child = std::make_shared<State>();
  child->parent = state_;
  return Context(std::move(child));
}

Context Context::WithTimeout(const std::chrono::milliseconds timeout) const {
  auto child = std::make_shared<State>();
  child->parent = state_;
  child->deadline = Clock::now() + timeout;
  return Context(std::move(child));
}

void Context::Cancel() const { state_->cancelled = true; }

bool Context::IsCancelled() const { return !Err().ok(); }

Result<void> Context::Err() const {
  const auto now = Clock::now();
  for (const State* state = state_.get(); state != nullptr;
       state = state->parent.get()) {
    if (state->cancelled) {
      return RANGEIO_ERR("Context cancelled");
    }
    if (state->deadline && *state->deadline <= now) {
      return RANGEIO_ERR("Context deadline exceeded");
    }
  }
  return {};
}

}  // namespace rangeio
