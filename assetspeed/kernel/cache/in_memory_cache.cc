/*
 * Copyright 2016 Google Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


#include "assetspeed/kernel/cache/in_memory_cache.h"

#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

InMemoryCache::InMemoryCache(AbstractMutex* mutex)
    : mutex_(mutex),
      is_shut_down_(false) {
}

InMemoryCache::~InMemoryCache() {
}

void InMemoryCache::Get(const GoogleString& key, Callback* callback) {
  KeyState state = kNotFound;
  {
    ScopedMutex lock(mutex_.get());
    if (!is_shut_down_) {
      Map::const_iterator value_it = cache_.find(key);
      if (value_it != cache_.end()) {
        *callback->mutable_value() = value_it->second;
        state = kAvailable;
      }
    }
  }
  // The callback runs without the lock held.
  ValidateAndReportResult(key, state, callback);
}

bool InMemoryCache::Put(const GoogleString& key, StringPiece value) {
  ScopedMutex lock(mutex_.get());
  if (is_shut_down_) {
    return false;
  }
  cache_[key].assign(value.data(), value.size());
  return true;
}

void InMemoryCache::Delete(const GoogleString& key) {
  ScopedMutex lock(mutex_.get());
  if (!is_shut_down_) {
    cache_.erase(key);
  }
}

bool InMemoryCache::Clear() {
  ScopedMutex lock(mutex_.get());
  cache_.clear();
  return true;
}

bool InMemoryCache::GetUsage(CacheUsage* usage) {
  ScopedMutex lock(mutex_.get());
  usage->entry_count = cache_.size();
  usage->total_bytes = 0;
  for (Map::const_iterator p = cache_.begin(); p != cache_.end(); ++p) {
    usage->total_bytes += p->second.size();
  }
  return true;
}

bool InMemoryCache::IsHealthy() const {
  ScopedMutex lock(mutex_.get());
  return !is_shut_down_;
}

void InMemoryCache::ShutDown() {
  ScopedMutex lock(mutex_.get());
  is_shut_down_ = true;
}

}  // namespace assetspeed
