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

#include "rangeio/io/string.h"

#include <stddef.h>
#include <stdint.h>

#include <sstream>
#include <string>
#include <vector>

#include "rangeio/io/io.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

Result<std::string> ReadToString(Reader& reader, const size_t buffer_size) {
  RANGEIO_EXPECT_GT(buffer_size, 0);
  std::stringstream out;

  std::vector<char> buf(buffer_size);
  uint64_t data_read;
  while ((data_read = RANGEIO_EXPECT(reader.Read(buf.data(), buf.size()))) > 0) {
    out.write(buf.data(), data_read);
  }
  return out.str();
}

Result<uint64_t> StringWriter::Write(const void* buf, const uint64_t count) {
  contents_.append(static_cast<const char*>(buf), count);
  return count;
}

}  // namespace rangeio
