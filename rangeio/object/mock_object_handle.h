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

#include <gmock/gmock.h>

#include "rangeio/context/context.h"
#include "rangeio/object/object_handle.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

class MockObjectHandle : public ObjectHandle {
 public:
  MOCK_METHOD(Result<ObjectAttrs>, Attrs, (const Context&), (const, override));
  MOCK_METHOD(Result<std::unique_ptr<RangeStream>>, NewRangeReader,
              (const Context&, int64_t, int64_t), (const, override));
};

class MockRangeStream : public RangeStream {
 public:
  MOCK_METHOD(Result<uint64_t>, Read, (void*, uint64_t), (override));
  MOCK_METHOD(Result<void>, Close, (), (override));
};

}  // namespace rangeio
