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

#include "rangeio/io/copy.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <vector>

#include "rangeio/io/io.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {
namespace {

Result<void> WriteAll(Writer& writer, const char* buf, uint64_t size) {
  uint64_t chunk_written = 0;
  while (chunk_written < size) {
    uint64_t written =
        RANGEIO_EXPECT(writer.Write(buf + chunk_written, size - chunk_written));
    RANGEIO_EXPECT_GT(written, 0, "Premature EOF on writer");
    chunk_written += written;
  }
  return {};
}

}  // namespace

Result<uint64_t> Copy(Reader& reader, Writer& writer,
                      const size_t buffer_size) {
  RANGEIO_EXPECT_GT(buffer_size, 0);
  std::vector<char> buf(buffer_size);
  uint64_t total = 0;
  uint64_t chunk_read;
  while ((chunk_read = RANGEIO_EXPECT(reader.Read(buf.data(), buf.size()))) >
         0) {
    RANGEIO_EXPECT(WriteAll(writer, buf.data(), chunk_read));
    total += chunk_read;
  }
  return total;
}

Result<uint64_t> CopyN(Reader& reader, Writer& writer, const uint64_t count,
                       const size_t buffer_size) {
  RANGEIO_EXPECT_GT(buffer_size, 0);
  std::vector<char> buf(std::min<uint64_t>(buffer_size, count));
  uint64_t total = 0;
  while (total < count) {
    uint64_t to_read = std::min<uint64_t>(buf.size(), count - total);
    uint64_t chunk_read = RANGEIO_EXPECT(reader.Read(buf.data(), to_read));
    RANGEIO_EXPECTF(chunk_read > 0,
                    "Premature EOF on reader after {} of {} bytes", total,
                    count);
    RANGEIO_EXPECT(WriteAll(writer, buf.data(), chunk_read));
    total += chunk_read;
  }
  return total;
}

}  // namespace rangeio
