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
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

// Fills `buf` completely from the reader's current position, failing if the
// stream ends first.
Result<void> ReadExact(Reader&, char* buf, size_t size);

// Fills `buf` completely from `offset`, failing if the data ends first.
Result<void> PReadExact(const ReaderSeeker&, char* buf, size_t size,
                        uint64_t offset);

template <typename T>
Result<T> PReadExactBinary(const ReaderSeeker& reader, uint64_t offset) {
  T data;
  char* const data_char = reinterpret_cast<char*>(&data);
  RANGEIO_EXPECT(PReadExact(reader, data_char, sizeof(data), offset));
  return data;
}

}  // namespace rangeio
