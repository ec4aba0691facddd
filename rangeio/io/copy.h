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

#include <stddef.h>
#include <stdint.h>

#include "rangeio/io/io.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

inline constexpr size_t kDefaultCopyBufferSize = 1 << 16;

// Moves data from the Reader to the Writer until the Reader reaches end of
// stream, without doing additional seeking on either. If either has its seek
// pointer set somewhere in the middle of the data, reading and writing starts
// from that point. Returns the number of bytes copied.
Result<uint64_t> Copy(Reader&, Writer&,
                      size_t buffer_size = kDefaultCopyBufferSize);

// Like `Copy`, but stops after `count` bytes. Fails if the Reader reaches end
// of stream first; the bytes read until then have been written.
Result<uint64_t> CopyN(Reader&, Writer&, uint64_t count,
                       size_t buffer_size = kDefaultCopyBufferSize);

}  // namespace rangeio
