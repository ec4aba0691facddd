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

#include <stdint.h>

#include <memory>
#include <string>

#include "rangeio/context/context.h"
#include "rangeio/io/io.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

struct ObjectAttrs {
  std::string name;
  int64_t size = 0;
};

// Forward-only byte stream over a contiguous range of an object.
class RangeStream : public Reader, public Closer {};

/**
 * Capability to a single remote object: its metadata, and sequential reads
 * over a byte range of it. Implementations own the transport and whatever
 * authentication it needs.
 */
class ObjectHandle {
 public:
  virtual ~ObjectHandle() = default;

  virtual Result<ObjectAttrs> Attrs(const Context& ctx) const = 0;

  // Opens a stream over `length` bytes starting at `offset`, or up to the end
  // of the object when `length` is negative. The stream observes `ctx` for
  // as long as it is open.
  virtual Result<std::unique_ptr<RangeStream>> NewRangeReader(
      const Context& ctx, int64_t offset, int64_t length) const = 0;
};

}  // namespace rangeio
