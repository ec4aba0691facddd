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

#include "rangeio/io/seek.h"

#include <stdint.h>
#include <stdio.h>

#include <string_view>

#include "rangeio/io/io.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

Result<int64_t> Seek(Seeker& seeker, const int64_t offset, const int whence) {
  switch (whence) {
    case SEEK_SET:
      return RANGEIO_EXPECT(seeker.SeekSet(offset));
    case SEEK_CUR:
      return RANGEIO_EXPECT(seeker.SeekCur(offset));
    case SEEK_END:
      return RANGEIO_EXPECT(seeker.SeekEnd(offset));
    default:
      return RANGEIO_ERRF("Illegal whence value {}", whence);
  }
}

Result<int> WhenceFromString(const std::string_view name) {
  if (name == "set") {
    return SEEK_SET;
  } else if (name == "cur") {
    return SEEK_CUR;
  } else if (name == "end") {
    return SEEK_END;
  }
  return RANGEIO_ERRF("Unknown whence '{}', expected set, cur or end", name);
}

}  // namespace rangeio
