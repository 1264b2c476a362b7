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


#ifndef ASSETSPEED_KERNEL_CACHE_IN_MEMORY_CACHE_H_
#define ASSETSPEED_KERNEL_CACHE_IN_MEMORY_CACHE_H_

#include <unordered_map>

#include "assetspeed/kernel/base/abstract_mutex.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/scoped_ptr.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/cache/cache_interface.h"

namespace assetspeed {

// Simple in-memory implementation of CacheInterface without automatic
// purging.  All operations hold the mutex, so one instance may be shared
// between threads.  Stored values are copies.
class InMemoryCache : public CacheInterface {
 public:
  // Takes ownership of the mutex.
  explicit InMemoryCache(AbstractMutex* mutex);
  ~InMemoryCache() override;

  void Get(const GoogleString& key, Callback* callback) override;
  bool Put(const GoogleString& key, StringPiece value) override;
  void Delete(const GoogleString& key) override;
  bool Clear() override;
  bool GetUsage(CacheUsage* usage) override;
  GoogleString Name() const override { return "InMemoryCache"; }
  bool IsBlocking() const override { return true; }
  bool IsHealthy() const override;
  void ShutDown() override;

 private:
  typedef std::unordered_map<GoogleString, GoogleString> Map;

  scoped_ptr<AbstractMutex> mutex_;
  Map cache_;
  bool is_shut_down_;

  DISALLOW_COPY_AND_ASSIGN(InMemoryCache);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_CACHE_IN_MEMORY_CACHE_H_
