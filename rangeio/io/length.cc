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

#include "rangeio/io/length.h"

#include <stdint.h>

#include "rangeio/io/io.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {

Result<int64_t> Length(Seeker& seeker) {
  int64_t current_pos = RANGEIO_EXPECT(seeker.SeekCur(0));
  int64_t end = RANGEIO_EXPECT(seeker.SeekEnd(0));
  RANGEIO_EXPECT(seeker.SeekSet(current_pos));
  return end;
}

}  // namespace rangeio
