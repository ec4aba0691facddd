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
#include "rangeio/object/object_handle.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

/**
 * Presents bytes `[begin, begin + length)` of another object as an object of
 * its own, e.g. a member stored uncompressed inside an archive. Range streams
 * are opened on the wrapped object, so a `SeekableRangeReader` over a window
 * fetches only the bytes of the window.
 *
 * The window is clipped to the end of the wrapped object when its attributes
 * are queried. The wrapped object must outlive the window.
 */
class ObjectWindow : public ObjectHandle {
 public:
  ObjectWindow(const ObjectHandle& object, uint64_t begin, uint64_t length);

  // Reports the wrapped object's name with the window appended, and the
  // number of bytes of the wrapped object that fall inside the window.
  Result<ObjectAttrs> Attrs(const Context& ctx) const override;
  // `offset` and `length` are relative to the window. A range never extends
  // past the end of the window.
  Result<std::unique_ptr<RangeStream>> NewRangeReader(
      const Context& ctx, int64_t offset, int64_t length) const override;

 private:
  const ObjectHandle* object_;
  uint64_t begin_;
  uint64_t length_;
};

}  // namespace rangeio
