/*
 * Copyright (c) 2024 dingodb.com, Inc. All Rights Reserved
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

#ifndef CHUNKFS_SRC_UTILS_STRING_H_
#define CHUNKFS_SRC_UTILS_STRING_H_

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>

#include <cstdint>
#include <string>

namespace chunkfs {
namespace utils {

inline bool Str2Int(const std::string& str, uint64_t* num) noexcept {
  return absl::SimpleAtoi(str, num);
}

inline bool Str2Int(const std::string& str, int64_t* num) noexcept {
  return absl::SimpleAtoi(str, num);
}

inline std::string TrimSpace(const std::string& str) {
  return std::string(absl::StripAsciiWhitespace(str));
}

}  // namespace utils
}  // namespace chunkfs

#endif  // CHUNKFS_SRC_UTILS_STRING_H_
