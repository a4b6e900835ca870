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

#ifndef CHUNKFS_SRC_COMMON_STATUS_H_
#define CHUNKFS_SRC_COMMON_STATUS_H_

#include <cerrno>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace chunkfs {

/// @brief Return the given status if it is not @c OK.
#define CHUNKFS_RETURN_NOT_OK(s)       \
  do {                                 \
    const ::chunkfs::Status& _s = (s); \
    if (!_s.ok()) return _s;           \
  } while (0)

#undef DECLARE_ERROR_STATUS

#define DECLARE_ERROR_STATUS(NAME, CODE)                            \
  static Status NAME(std::string_view msg,                          \
                     std::string_view msg2 = std::string_view()) {  \
    return Status(CODE, kNone, msg, msg2);                          \
  }                                                                 \
  static Status NAME(int32_t p_errno, std::string_view msg,         \
                     std::string_view msg2 = std::string_view()) {  \
    return Status(CODE, p_errno, msg, msg2);                        \
  }                                                                 \
  bool Is##NAME() const { return code_ == (CODE); }

class Status {
 private:
  enum Code : uint8_t {
    kOk = 0,
    kInternal = 1,
    kInvalidParam = 2,
    kNotFound = 3,
    kNetError = 4,
    kTimeout = 5,
    kIoError = 6,
    kOutOfRange = 7,
    kNotSupport = 8,
    kCacheFull = 9,
    kEndOfFile = 10,
    kUnresolvable = 11,
    kFetchFailed = 12,
  };
  static const int32_t kNone = 0;

 public:
  // Create a success status.
  Status() noexcept : code_(kOk), errno_(kNone), state_(nullptr) {}
  ~Status() = default;

  Status(const Status& rhs);
  Status& operator=(const Status& rhs);

  Status(Status&& rhs) noexcept;
  Status& operator=(Status&& rhs) noexcept;
  bool operator==(const Status& rhs) const { return code_ == rhs.code_; }
  bool operator!=(const Status& rhs) const { return code_ != rhs.code_; }

  bool ok() const { return code_ == kOk; }  // NOLINT
  static Status OK() { return Status(); }

  DECLARE_ERROR_STATUS(Internal, kInternal);
  DECLARE_ERROR_STATUS(InvalidParam, kInvalidParam);
  DECLARE_ERROR_STATUS(NotFound, kNotFound);
  DECLARE_ERROR_STATUS(NetError, kNetError);
  DECLARE_ERROR_STATUS(Timeout, kTimeout);
  DECLARE_ERROR_STATUS(IoError, kIoError);
  DECLARE_ERROR_STATUS(OutOfRange, kOutOfRange);
  DECLARE_ERROR_STATUS(NotSupport, kNotSupport);
  DECLARE_ERROR_STATUS(CacheFull, kCacheFull);
  DECLARE_ERROR_STATUS(EndOfFile, kEndOfFile);
  // volume lookup exhausted its retries or found no location
  DECLARE_ERROR_STATUS(Unresolvable, kUnresolvable);
  // every candidate url failed to serve the chunk
  DECLARE_ERROR_STATUS(FetchFailed, kFetchFailed);

  static Status EndOfFile() { return Status(kEndOfFile, kNone, "EOF", ""); }

  // Return a string representation of this status suitable for printing.
  // Returns the string "OK" for success.
  std::string ToString() const;

  int32_t Errno() const { return errno_; }

  int ToSysErrNo() const {
    switch (code_) {
      case kOk:
        return 0;
      case kInvalidParam:
        return EINVAL;
      case kNotFound:
        return ENOENT;
      case kTimeout:
        return ETIMEDOUT;
      case kOutOfRange:
        return ERANGE;
      case kNotSupport:
        return EOPNOTSUPP;
      case kCacheFull:
        return ENOSPC;
      case kUnresolvable:
        return EHOSTUNREACH;
      case kEndOfFile:
      case kInternal:
      case kNetError:
      case kIoError:
      case kFetchFailed:
      default:
        return EIO;
    }
  }

 private:
  Status(Code code, int32_t p_errno, std::string_view msg,
         std::string_view msg2);

  static std::unique_ptr<const char[]> CopyState(const char* s);

  Code code_;
  int32_t errno_;
  // A nullptr state_ (which is at least the case for OK) means the extra
  // message is empty.
  std::unique_ptr<const char[]> state_;
};

inline Status::Status(const Status& rhs)
    : code_(rhs.code_), errno_(rhs.errno_) {
  state_ = (rhs.state_ == nullptr) ? nullptr : CopyState(rhs.state_.get());
}

inline Status& Status::operator=(const Status& rhs) {
  if (this != &rhs) {
    code_ = rhs.code_;
    errno_ = rhs.errno_;
    state_ = (rhs.state_ == nullptr) ? nullptr : CopyState(rhs.state_.get());
  }
  return *this;
}

inline Status::Status(Status&& rhs) noexcept : Status() {
  *this = std::move(rhs);
}

inline Status& Status::operator=(Status&& rhs) noexcept {
  if (this != &rhs) {
    code_ = rhs.code_;
    errno_ = rhs.errno_;
    state_ = std::move(rhs.state_);
  }
  return *this;
}

#undef DECLARE_ERROR_STATUS

}  // namespace chunkfs

#endif  // CHUNKFS_SRC_COMMON_STATUS_H_
