// Copyright (c) 2023 dingodb.com, Inc. All Rights Reserved
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef CHUNKFS_SRC_COMMON_LOGGING_H_
#define CHUNKFS_SRC_COMMON_LOGGING_H_

#include <string>

#include "glog/logging.h"

namespace chunkfs {

// The larger the number, the more comprehensive information is displayed.
#define CHUNKFS_DEBUG 79

#define LOG_DEBUG VLOG(CHUNKFS_DEBUG)

class Logger {
 public:
  // Route glog output to <log_dir>/<role>.{info,warn,error,fatal}.log.
  static void Init(const std::string& log_dir, const std::string& role);

  static void SetMinLogLevel(int level);
  static int GetMinLogLevel();

  static void SetMinVerboseLevel(int v);
  static int GetMinVerboseLevel();
};

}  // namespace chunkfs

#endif  // CHUNKFS_SRC_COMMON_LOGGING_H_
