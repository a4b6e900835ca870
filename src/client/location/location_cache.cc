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

#include "client/location/location_cache.h"

#include <glog/logging.h>

namespace chunkfs {
namespace client {

bool LocationCache::Get(const std::string& volume_id,
                        LocationList* locations) {
  bthread::RWLockRdGuard guard(rwlock_);
  auto iter = entries_.find(volume_id);
  if (iter == entries_.end()) {
    return false;
  }
  *locations = iter->second;
  return true;
}

void LocationCache::Put(const std::string& volume_id,
                        const LocationList& locations) {
  bthread::RWLockWrGuard guard(rwlock_);
  entries_[volume_id] = locations;
}

void LocationCache::Invalidate(const std::string& volume_id) {
  bthread::RWLockWrGuard guard(rwlock_);
  if (entries_.erase(volume_id) > 0) {
    VLOG(3) << "Invalidate locations of volume " << volume_id;
  }
}

void LocationCache::Clear() {
  bthread::RWLockWrGuard guard(rwlock_);
  entries_.clear();
}

size_t LocationCache::Size() {
  bthread::RWLockRdGuard guard(rwlock_);
  return entries_.size();
}

}  // namespace client
}  // namespace chunkfs
