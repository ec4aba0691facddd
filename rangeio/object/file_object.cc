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

#include "rangeio/object/file_object.h"

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include <android-base/unique_fd.h>

#include "rangeio/context/context.h"
#include "rangeio/object/object_handle.h"
#include "rangeio/result/expect.h"
#include "rangeio/result/result_type.h"

namespace rangeio {
namespace {

Result<android::base::unique_fd> OpenReadOnly(const std::string& path) {
  android::base::unique_fd fd(open(path.c_str(), O_CLOEXEC | O_RDONLY));
  RANGEIO_EXPECTF(fd.ok(), "Failed to open '{}' with O_RDONLY: '{}'", path,
                  strerror(errno));
  return fd;
}

class FileRangeStream : public RangeStream {
 public:
  FileRangeStream(Context ctx, std::string path, android::base::unique_fd fd,
                  int64_t remaining)
      : ctx_(std::move(ctx)),
        path_(std::move(path)),
        fd_(std::move(fd)),
        remaining_(remaining) {}

  Result<uint64_t> Read(void* buf, uint64_t count) override {
    RANGEIO_EXPECTF(fd_.ok(), "Read on closed stream over '{}'", path_);
    RANGEIO_EXPECT(ctx_.Err());
    if (remaining_ >= 0) {
      count = std::min(count, static_cast<uint64_t>(remaining_));
    }
    if (count == 0) {
      return 0;
    }
    ssize_t data_read = TEMP_FAILURE_RETRY(read(fd_.get(), buf, count));
    RANGEIO_EXPECT_GE(data_read, 0, "read from '" << path_ << "' failed: "
                                                  << strerror(errno));
    if (remaining_ >= 0) {
      remaining_ -= data_read;
    }
    return data_read;
  }

  Result<void> Close() override {
    RANGEIO_EXPECTF(fd_.ok(), "Stream over '{}' was already closed", path_);
    int fd = fd_.release();
    RANGEIO_EXPECT_EQ(close(fd), 0,
                      "close on '" << path_ << "' failed: " << strerror(errno));
    return {};
  }

 private:
  Context ctx_;
  std::string path_;
  android::base::unique_fd fd_;
  // Bytes left in the range, or -1 to read until end of file.
  int64_t remaining_;
};

}  // namespace

FileObject::FileObject(std::string path) : path_(std::move(path)) {}

Result<ObjectAttrs> FileObject::Attrs(const Context& ctx) const {
  RANGEIO_EXPECT(ctx.Err());
  android::base::unique_fd fd = RANGEIO_EXPECT(OpenReadOnly(path_));
  struct stat st;
  RANGEIO_EXPECT_EQ(fstat(fd.get(), &st), 0,
                    "fstat on '" << path_ << "' failed: " << strerror(errno));
  ObjectAttrs attrs;
  attrs.name = path_;
  attrs.size = st.st_size;
  return attrs;
}

Result<std::unique_ptr<RangeStream>> FileObject::NewRangeReader(
    const Context& ctx, const int64_t offset, const int64_t length) const {
  RANGEIO_EXPECT(ctx.Err());
  RANGEIO_EXPECT_GE(offset, 0, "Negative offset into '" << path_ << "'");
  android::base::unique_fd fd = RANGEIO_EXPECT(OpenReadOnly(path_));
  RANGEIO_EXPECT_EQ(lseek(fd.get(), offset, SEEK_SET), offset,
                    "lseek on '" << path_ << "' failed: " << strerror(errno));
  return std::make_unique<FileRangeStream>(ctx, path_, std::move(fd),
                                           length < 0 ? -1 : length);
}

}  // namespace rangeio
