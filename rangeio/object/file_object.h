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

// An object stored in a local file. Each range stream holds its own file
// descriptor, so streams are independent of each other.
class FileObject : public ObjectHandle {
 public:
  explicit FileObject(std::string path);

  Result<ObjectAttrs> Attrs(const Context& ctx) const override;
  Result<std::unique_ptr<RangeStream>> NewRangeReader(
      const Context& ctx, int64_t offset, int64_t length) const override;

 private:
  std::string path_;
};

}  // namespace rangeio
