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
#include <string_view>
#include <vector>

#include "rangeio/context/context.h"
#include "rangeio/object/object_handle.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

// An object whose content lives in memory. Keeps counts of the range streams
// it hands out.
class InMemoryObject : public ObjectHandle {
 public:
  InMemoryObject(std::string name, std::vector<char> data);
  InMemoryObject(std::string name, std::string_view data);

  Result<ObjectAttrs> Attrs(const Context& ctx) const override;
  Result<std::unique_ptr<RangeStream>> NewRangeReader(
      const Context& ctx, int64_t offset, int64_t length) const override;

  // Streams successfully opened so far.
  int RangeReadersOpened() const;
  // Streams opened and not yet closed or destroyed.
  int OpenRangeReaders() const;

 private:
  class Stream;
  struct Counters;

  std::string name_;
  std::shared_ptr<const std::vector<char>> data_;
  std::shared_ptr<Counters> counters_;
};

}  // namespace rangeio
