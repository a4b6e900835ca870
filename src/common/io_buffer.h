/*
 * Copyright (c) 2025 dingodb.com, Inc. All Rights Reserved
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef CHUNKFS_SRC_COMMON_IO_BUFFER_H_
#define CHUNKFS_SRC_COMMON_IO_BUFFER_H_

#include <butil/iobuf.h>

#include <cstddef>
#include <string>

namespace chunkfs {

// Reference counted byte buffer, copies share the underlying blocks.
class IOBuffer {
 public:
  IOBuffer() = default;
  ~IOBuffer() = default;
  IOBuffer(const IOBuffer& buffer) = default;
  IOBuffer& operator=(const IOBuffer& buffer) = default;
  IOBuffer(IOBuffer&& buffer) noexcept : iobuf_(buffer.iobuf_.movable()) {}
  IOBuffer& operator=(IOBuffer&& buffer) noexcept {
    if (this != &buffer) {
      iobuf_ = buffer.iobuf_.movable();
    }
    return *this;
  }

  explicit IOBuffer(const butil::IOBuf& iobuf) : iobuf_(iobuf) {}
  explicit IOBuffer(const std::string& data) { iobuf_.append(data); }

  // Copy at most n bytes starting from pos, return the number copied.
  size_t CopyTo(char* dest, size_t n = (size_t)-1L, size_t pos = 0) const {
    return iobuf_.copy_to(dest, n, pos);
  }

  void Clear() { iobuf_.clear(); }

  size_t Size() const { return iobuf_.length(); }

  std::string ToString() const { return iobuf_.to_string(); }

 private:
  butil::IOBuf iobuf_;
};

}  // namespace chunkfs

#endif  // CHUNKFS_SRC_COMMON_IO_BUFFER_H_
