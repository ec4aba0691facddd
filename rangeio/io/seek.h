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

#include <string_view>

#include "rangeio/io/io.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

// Has the semantics of lseek(2). `whence` is one of SEEK_SET, SEEK_CUR or
// SEEK_END; any other value fails without touching `seeker`.
Result<int64_t> Seek(Seeker& seeker, int64_t offset, int whence);

// Parses "set", "cur" or "end" into the matching SEEK_* constant.
Result<int> WhenceFromString(std::string_view name);

}  // namespace rangeio
