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


#include "assetspeed/kernel/cache/asset_cache.h"

#include "assetspeed/kernel/base/hasher.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/statistics.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/minify/asset_identity.h"
#include "assetspeed/kernel/minify/minify_pipeline.h"

namespace assetspeed {

const char AssetCache::kHits[] = "asset_cache_hits";
const char AssetCache::kMisses[] = "asset_cache_misses";
const char AssetCache::kWriteFailures[] = "asset_cache_write_failures";
const char AssetCache::kReadFailures[] = "asset_cache_read_failures";

AssetCache::AssetCache(CacheInterface* storage,
                       const MinifyPipeline* pipeline,
                       const Hasher* key_hasher, Statistics* stats,
                       MessageHandler* handler)
    : storage_(storage),
      pipeline_(pipeline),
      key_hasher_(key_hasher),
      handler_(handler),
      hits_(stats->GetVariable(kHits)),
      misses_(stats->GetVariable(kMisses)),
      write_failures_(stats->GetVariable(kWriteFailures)),
      read_failures_(stats->GetVariable(kReadFailures)) {
}

AssetCache::~AssetCache() {
}

void AssetCache::InitStats(Statistics* statistics) {
  statistics->AddVariable(kHits);
  statistics->AddVariable(kMisses);
  statistics->AddVariable(kWriteFailures);
  statistics->AddVariable(kReadFailures);
}

GoogleString AssetCache::Key(const AssetIdentity& identity) const {
  return key_hasher_->Hash(identity.KeyMaterial());
}

CacheInterface::KeyState AssetCache::Lookup(const AssetIdentity& identity,
                                            GoogleString* value) {
  CacheInterface::SynchronousCallback callback;
  storage_->Get(Key(identity), &callback);
  CacheInterface::KeyState state =
      callback.called() ? callback.state() : CacheInterface::kNotFound;
  switch (state) {
    case CacheInterface::kAvailable:
      hits_->Add(1);
      value->swap(*callback.mutable_value());
      break;
    case CacheInterface::kReadError:
      read_failures_->Add(1);
      misses_->Add(1);
      handler_->Message(kWarning, "Failed to read cached %s, recomputing",
                        identity.handle().c_str());
      break;
    case CacheInterface::kNotFound:
      misses_->Add(1);
      break;
  }
  return state;
}

bool AssetCache::Get(const AssetIdentity& identity,
                     GoogleString* output_text) {
  if (!identity.HasValidContentHash()) {
    return false;
  }
  return Lookup(identity, output_text) == CacheInterface::kAvailable;
}

void AssetCache::PutIfAbsent(const MinifyRequest& request,
                             AssetCacheResult* result) {
  const AssetIdentity& identity = request.identity();
  const bool cacheable = identity.HasValidContentHash();
  if (!cacheable) {
    handler_->Message(kWarning,
                      "Asset %s has a malformed content hash, not caching",
                      identity.handle().c_str());
  } else {
    CacheInterface::KeyState state = Lookup(identity, &result->output_text);
    if (state == CacheInterface::kAvailable) {
      result->cache_hit = true;
      return;
    }
    result->storage_read_failure = (state == CacheInterface::kReadError);
  }

  MinifyResult minify_result;
  pipeline_->Minify(request, &minify_result);
  result->cache_hit = false;
  result->minified = minify_result.succeeded;
  result->status = minify_result.status;
  result->output_text.swap(minify_result.output_text);

  // Guard fallbacks depend on the configuration, which may change without
  // the asset changing, so they are recomputed on every request.
  if (!cacheable || IsGuardStatus(result->status)) {
    return;
  }
  if (storage_->Put(Key(identity), result->output_text)) {
    result->stored = true;
  } else {
    result->storage_write_failure = true;
    write_failures_->Add(1);
    handler_->Message(kWarning, "Failed to store minified %s",
                      identity.handle().c_str());
  }
}

void AssetCache::Delete(const AssetIdentity& identity) {
  storage_->Delete(Key(identity));
}

bool AssetCache::Clear() {
  return storage_->Clear();
}

bool AssetCache::Stats(CacheUsage* usage) {
  return storage_->GetUsage(usage);
}

}  // namespace assetspeed
