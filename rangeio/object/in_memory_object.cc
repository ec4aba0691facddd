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

#include "rangeio/object/in_memory_object.h"

#include <stdint.h>
#include <string.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rangeio/context/context.h"
#include "rangeio/object/object_handle.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

struct InMemoryObject::Counters {
  std::atomic_int opened = 0;
  std::atomic_int open = 0;
};

class InMemoryObject::Stream : public RangeStream {
 public:
  Stream(Context ctx, std::shared_ptr<const std::vector<char>> data,
         std::shared_ptr<Counters> counters, uint64_t begin, uint64_t end)
      : ctx_(std::move(ctx)),
        data_(std::move(data)),
        counters_(std::move(counters)),
        cursor_(begin),
        end_(end) {
    counters_->opened++;
    counters_->open++;
  }

  ~Stream() override {
    if (!closed_) {
      counters_->open--;
    }
  }

  Result<uint64_t> Read(void* buf, uint64_t count) override {
    RANGEIO_EXPECT(!closed_, "Read on a closed stream");
    RANGEIO_EXPECT(ctx_.Err());
    uint64_t to_read = std::min(count, end_ - cursor_);
    if (to_read > 0) {
      memcpy(buf, data_->data() + cursor_, to_read);
    }
    cursor_ += to_read;
    return to_read;
  }

  Result<void> Close() override {
    RANGEIO_EXPECT(!closed_, "Stream was already closed");
    closed_ = true;
    counters_->open--;
    return {};
  }

 private:
  Context ctx_;
  std::shared_ptr<const std::vector<char>> data_;
  std::shared_ptr<Counters> counters_;
  uint64_t cursor_;
  uint64_t end_;
  bool closed_ = false;
};

InMemoryObject::InMemoryObject(std::string name, std::vector<char> data)
    : name_(std::move(name)),
      data_(std::make_shared<const std::vector<char>>(std::move(data))),
      counters_(std::make_shared<Counters>()) {}

InMemoryObject::InMemoryObject(std::string name, const std::string_view data)
    : InMemoryObject(std::move(name),
                     std::vector<char>(data.begin(), data.end())) {}

int InMemoryObject::RangeReadersOpened() const { return counters_->opened; }

int InMemoryObject::OpenRangeReaders() const { return counters_->open; }

Result<ObjectAttrs> InMemoryObject::Attrs(const Context& ctx) const {
  RANGEIO_EXPECT(ctx.Err());
  ObjectAttrs attrs;
  attrs.name = name_;
  attrs.size = static_cast<int64_t>(data_->size());
  return attrs;
}

Result<std::unique_ptr<RangeStream>> InMemoryObject::NewRangeReader(
    const Context& ctx, const int64_t offset, const int64_t length) const {
  RANGEIO_EXPECT(ctx.Err());
  const uint64_t size = data_->size();
  RANGEIO_EXPECT_GE(offset, 0, "Negative offset into '" << name_ << "'");
  RANGEIO_EXPECTF(static_cast<uint64_t>(offset) <= size,
                  "Offset {} is past the end of '{}' ({} bytes)", offset,
                  name_, size);
  uint64_t end = size;
  if (length >= 0) {
    end = std::min(size, static_cast<uint64_t>(offset + length));
  }
  return std::make_unique<Stream>(ctx, data_, counters_, offset, end);
}

}  // namespace rangeio
