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

#include "rangeio/object/object_window.h"

#include <stdint.h>

#include <algorithm>
#include <limits>
#include <memory>

#include <fmt/format.h>

#include "rangeio/context/context.h"
#include "rangeio/object/object_handle.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

ObjectWindow::ObjectWindow(const ObjectHandle& object, const uint64_t begin,
                           const uint64_t length)
    : object_(&object), begin_(begin), length_(length) {}

Result<ObjectAttrs> ObjectWindow::Attrs(const Context& ctx) const {
  ObjectAttrs attrs = RANGEIO_EXPECT(object_->Attrs(ctx));
  const uint64_t size = std::max<int64_t>(attrs.size, 0);
  uint64_t window_size = 0;
  if (begin_ < size) {
    window_size = std::min(length_, size - begin_);
  }
  attrs.name = fmt::format("{}[{}+{}]", attrs.name, begin_, length_);
  attrs.size = static_cast<int64_t>(window_size);
  return attrs;
}

Result<std::unique_ptr<RangeStream>> ObjectWindow::NewRangeReader(
    const Context& ctx, const int64_t offset, const int64_t length) const {
  RANGEIO_EXPECT_GE(offset, 0, "Negative offset into window");
  RANGEIO_EXPECTF(static_cast<uint64_t>(offset) <= length_,
                  "Offset {} is past the end of a {} byte window", offset,
                  length_);
  constexpr uint64_t kMaxOffset = std::numeric_limits<int64_t>::max();
  RANGEIO_EXPECTF(begin_ <= kMaxOffset - offset,
                  "Window offset {} + {} overflows", begin_, offset);
  uint64_t remaining = std::min(length_ - offset, kMaxOffset);
  if (length >= 0) {
    remaining = std::min<uint64_t>(remaining, length);
  }
  return RANGEIO_EXPECT(object_->NewRangeReader(
      ctx, static_cast<int64_t>(begin_ + offset),
      static_cast<int64_t>(remaining)));
}

}  // namespace rangeio
