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

#include "rangeio/io/read_exact.h"

#include <stddef.h>
#include <stdint.h>

#include "rangeio/io/io.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

Result<void> ReadExact(Reader& reader, char* buf, const size_t size) {
  size_t total = 0;
  while (total < size) {
    uint64_t data_read = RANGEIO_EXPECT(reader.Read(buf + total, size - total));
    RANGEIO_EXPECTF(data_read > 0, "Unexpected EOF after {} of {} bytes",
                    total, size);
    total += data_read;
  }
  return {};
}

Result<void> PReadExact(const ReaderSeeker& reader, char* buf,
                        const size_t size, const uint64_t offset) {
  size_t total = 0;
  while (total < size) {
    uint64_t data_read = RANGEIO_EXPECT(
        reader.PRead(buf + total, size - total, offset + total));
    RANGEIO_EXPECTF(data_read > 0,
                    "Unexpected EOF at offset {}, {} of {} bytes read",
                    offset + total, total, size);
    total += data_read;
  }
  return {};
}

}  // namespace rangeio
