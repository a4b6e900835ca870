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

#include "common/status.h"

#include <cstring>
#include <string>

#include "fmt/core.h"

namespace chunkfs {

std::unique_ptr<const char[]> Status::CopyState(const char* s) {
  const size_t cch = std::strlen(s) + 1;  // +1 for the null terminator
  char* rv = new char[cch];
  std::strncpy(rv, s, cch);
  return std::unique_ptr<const char[]>(rv);
}

Status::Status(Code code, int32_t p_errno, std::string_view msg,
               std::string_view msg2)
    : code_(code), errno_(p_errno) {
  const uint32_t len1 = static_cast<uint32_t>(msg.size());
  const uint32_t len2 = static_cast<uint32_t>(msg2.size());
  const uint32_t size = len1 + (len2 ? (2 + len2) : 0);

  char* const result = new char[size + 1];  // +1 for null terminator
  std::memcpy(result, msg.data(), len1);

  if (len2) {
    result[len1] = ':';
    result[len1 + 1] = ' ';
    std::memcpy(result + len1 + 2, msg2.data(), len2);
  }
  result[size] = '\0';  // null terminator for C style string
  state_.reset(result);
}

std::string Status::ToString() const {
  if (state_ == nullptr) {
    return "OK";
  }

  const char* type;
  switch (code_) {
    case kOk:
      type = "OK";
      break;
    case kInternal:
      type = "Internal";
      break;
    case kInvalidParam:
      type = "InvalidParam";
      break;
    case kNotFound:
      type = "NotFound";
      break;
    case kNetError:
      type = "NetError";
      break;
    case kTimeout:
      type = "Timeout";
      break;
    case kIoError:
      type = "IoError";
      break;
    case kOutOfRange:
      type = "OutOfRange";
      break;
    case kNotSupport:
      type = "NotSupport";
      break;
    case kCacheFull:
      type = "CacheFull";
      break;
    case kEndOfFile:
      type = "EndOfFile";
      break;
    case kUnresolvable:
      type = "Unresolvable";
      break;
    case kFetchFailed:
      type = "FetchFailed";
      break;
    default:
      return fmt::format("Unknown code({}): {}", static_cast<int>(code_),
                         state_.get());
  }

  if (errno_ != kNone) {
    return fmt::format("{}(errno={}): {}", type, errno_, state_.get());
  }
  return fmt::format("{}: {}", type, state_.get());
}

}  // namespace chunkfs
