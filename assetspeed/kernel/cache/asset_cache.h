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


#ifndef ASSETSPEED_KERNEL_CACHE_ASSET_CACHE_H_
#define ASSETSPEED_KERNEL_CACHE_ASSET_CACHE_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/cache/cache_interface.h"
#include "assetspeed/kernel/minify/minify_status.h"

namespace assetspeed {

class AssetIdentity;
class Hasher;
class MessageHandler;
class MinifyPipeline;
class MinifyRequest;
class Statistics;
class Variable;

// What PutIfAbsent served and how it got there.
struct AssetCacheResult {
  AssetCacheResult()
      : cache_hit(false),
        minified(false),
        status(kMinifyOk),
        stored(false),
        storage_read_failure(false),
        storage_write_failure(false) {
  }

  GoogleString output_text;
  // Served from storage without running the pipeline.
  bool cache_hit;
  // On a miss, whether the pipeline succeeded, and why it fell back if not.
  bool minified;
  MinifyStatus status;
  // On a miss, whether output_text was written to storage.
  bool stored;
  // The lookup failed to read an existing entry, and was treated as a miss.
  bool storage_read_failure;
  // output_text could not be stored.  It is still served; the next
  // request computes it again.
  bool storage_write_failure;
};

// Maps asset identities to minified text.  The key is the web64 hash of
// the identity's handle, content hash and mtime, so it is stable across
// restarts and any change to the asset yields a new key.  This is the only
// caller of the minification pipeline.
//
// Safe to share between threads if the storage is.  Two concurrent misses
// on one identity may both run the pipeline; they store identical bytes.
class AssetCache {
 public:
  static const char kHits[];
  static const char kMisses[];
  static const char kWriteFailures[];
  static const char kReadFailures[];

  // storage must be blocking.  None of the arguments are owned.
  AssetCache(CacheInterface* storage, const MinifyPipeline* pipeline,
             const Hasher* key_hasher, Statistics* stats,
             MessageHandler* handler);
  ~AssetCache();

  static void InitStats(Statistics* statistics);

  // The storage key for identity.
  GoogleString Key(const AssetIdentity& identity) const;

  // Looks up identity without running the pipeline.  Returns false on a
  // miss, including when the entry could not be read.
  bool Get(const AssetIdentity& identity, GoogleString* output_text);

  // Serves the stored text for request's identity, or minifies the raw
  // text, stores the result and serves it.  Never fails; the worst case
  // serves the raw text.
  void PutIfAbsent(const MinifyRequest& request, AssetCacheResult* result);

  void Delete(const AssetIdentity& identity);
  bool Clear();
  bool Stats(CacheUsage* usage);

  CacheInterface* storage() { return storage_; }

 private:
  // Fetches key into *value.  Counts the hit or miss.
  CacheInterface::KeyState Lookup(const AssetIdentity& identity,
                                  GoogleString* value);

  CacheInterface* storage_;
  const MinifyPipeline* pipeline_;
  const Hasher* key_hasher_;
  MessageHandler* handler_;

  Variable* hits_;
  Variable* misses_;
  Variable* write_failures_;
  Variable* read_failures_;

  DISALLOW_COPY_AND_ASSIGN(AssetCache);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_CACHE_ASSET_CACHE_H_
