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

#include "assetspeed/kernel/base/abstract_mutex.h"
#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/mock_hasher.h"
#include "assetspeed/kernel/base/mock_message_handler.h"
#include "assetspeed/kernel/base/scoped_ptr.h"
#include "assetspeed/kernel/base/stdio_file_system.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/thread.h"
#include "assetspeed/kernel/base/thread_system.h"
#include "assetspeed/kernel/cache/file_cache.h"
#include "assetspeed/kernel/cache/in_memory_cache.h"
#include "assetspeed/kernel/minify/asset_identity.h"
#include "assetspeed/kernel/minify/minify_options.h"
#include "assetspeed/kernel/minify/minify_pipeline.h"
#include "assetspeed/kernel/util/sha1_hasher.h"
#include "assetspeed/kernel/util/simple_stats.h"

namespace assetspeed {

namespace {

const char kCss[] = "  .a  {  color : red ;  margin:0px;  }";
const char kMinifiedCss[] = ".a{color:red;margin:0}";
const char kBrokenJs[] = "var s = 'unterminated;";

// An in-memory store whose reads and writes can be made to fail.
class FlakyCache : public InMemoryCache {
 public:
  explicit FlakyCache(AbstractMutex* mutex)
      : InMemoryCache(mutex),
        fail_gets_(false),
        fail_puts_(false) {
  }

  void Get(const GoogleString& key, Callback* callback) override {
    if (fail_gets_) {
      ValidateAndReportResult(key, kReadError, callback);
    } else {
      InMemoryCache::Get(key, callback);
    }
  }

  bool Put(const GoogleString& key, StringPiece value) override {
    return !fail_puts_ && InMemoryCache::Put(key, value);
  }

  void set_fail_gets(bool x) { fail_gets_ = x; }
  void set_fail_puts(bool x) { fail_puts_ = x; }

 private:
  bool fail_gets_;
  bool fail_puts_;
};

class AssetCacheTest : public testing::Test {
 protected:
  AssetCacheTest()
      : thread_system_(ThreadSystem::CreateThreadSystem()),
        stats_(thread_system_.get()),
        handler_(thread_system_->NewMutex()),
        storage_(thread_system_->NewMutex()) {
    MinifyPipeline::InitStats(&stats_);
    AssetCache::InitStats(&stats_);
    FileCache::InitStats(&stats_);
    pipeline_.reset(new MinifyPipeline(&options_, &stats_, &handler_));
    ResetAssetCache(&storage_);
  }

  void ResetAssetCache(CacheInterface* storage) {
    asset_cache_.reset(new AssetCache(storage, pipeline_.get(), &hasher_,
                                      &stats_, &handler_));
  }

  AssetIdentity Identity(StringPiece handle, StringPiece raw_text,
                         int64 mtime) {
    return AssetIdentity::Create(handle, raw_text, mtime, &hasher_);
  }

  AssetCacheResult Put(AssetLanguage language, StringPiece handle,
                       StringPiece raw_text, int64 mtime) {
    MinifyRequest request(language, raw_text,
                          Identity(handle, raw_text, mtime));
    AssetCacheResult result;
    asset_cache_->PutIfAbsent(request, &result);
    return result;
  }

  AssetCacheResult PutCss() {
    return Put(kCssLanguage, "style", kCss, 100);
  }

  int64 Stat(const char* name) {
    return stats_.GetVariable(name)->Get();
  }

  void CheckUsage(int64 expected_entries, int64 expected_bytes) {
    CacheUsage usage;
    ASSERT_TRUE(asset_cache_->Stats(&usage));
    EXPECT_EQ(expected_entries, usage.entry_count);
    EXPECT_EQ(expected_bytes, usage.total_bytes);
  }

  scoped_ptr<ThreadSystem> thread_system_;
  SimpleStats stats_;
  MockMessageHandler handler_;
  MinifyOptions options_;
  Sha1Hasher hasher_;
  FlakyCache storage_;
  scoped_ptr<MinifyPipeline> pipeline_;
  scoped_ptr<AssetCache> asset_cache_;
};

TEST_F(AssetCacheTest, MissThenHit) {
  AssetCacheResult first = PutCss();
  EXPECT_FALSE(first.cache_hit);
  EXPECT_TRUE(first.minified);
  EXPECT_TRUE(first.stored);
  EXPECT_EQ(kMinifyOk, first.status);
  EXPECT_STREQ(kMinifiedCss, first.output_text);

  AssetCacheResult second = PutCss();
  EXPECT_TRUE(second.cache_hit);
  EXPECT_FALSE(second.stored);
  EXPECT_STREQ(kMinifiedCss, second.output_text);

  EXPECT_EQ(1, Stat(AssetCache::kHits));
  EXPECT_EQ(1, Stat(AssetCache::kMisses));
  // The pipeline ran once.
  EXPECT_EQ(1, Stat(MinifyPipeline::kMinifySuccesses));
  CheckUsage(1, STATIC_STRLEN(kMinifiedCss));
}

TEST_F(AssetCacheTest, GetNeverMinifies) {
  GoogleString text;
  AssetIdentity identity = Identity("style", kCss, 100);
  EXPECT_FALSE(asset_cache_->Get(identity, &text));
  EXPECT_EQ(0, Stat(MinifyPipeline::kMinifySuccesses));
  EXPECT_EQ(0, Stat(MinifyPipeline::kMinifyFallbacks));
  CheckUsage(0, 0);

  PutCss();
  ASSERT_TRUE(asset_cache_->Get(identity, &text));
  EXPECT_STREQ(kMinifiedCss, text);
}

TEST_F(AssetCacheTest, IdentityChangesMiss) {
  PutCss();
  EXPECT_FALSE(Put(kCssLanguage, "style", kCss, 101).cache_hit);
  EXPECT_FALSE(Put(kCssLanguage, "other", kCss, 100).cache_hit);
  EXPECT_FALSE(Put(kCssLanguage, "style", "b { color : blue }", 100)
               .cache_hit);
  EXPECT_TRUE(PutCss().cache_hit);
  CheckUsage(4, 3 * STATIC_STRLEN(kMinifiedCss) +
             STATIC_STRLEN("b{color:blue}"));
}

TEST_F(AssetCacheTest, KeyIsStable) {
  AssetIdentity identity = Identity("style", kCss, 100);
  GoogleString key = asset_cache_->Key(identity);
  EXPECT_EQ(Sha1Hasher::kDefaultHashSize, static_cast<int>(key.size()));
  EXPECT_EQ(hasher_.Hash(identity.KeyMaterial()), key);
  EXPECT_EQ(key, asset_cache_->Key(Identity("style", kCss, 100)));
  EXPECT_NE(key, asset_cache_->Key(Identity("style", kCss, 10)));
  // Field boundaries can not shift between handle and hash.
  AssetIdentity a("ab", "c", 1);
  AssetIdentity b("a", "bc", 1);
  EXPECT_NE(asset_cache_->Key(a), asset_cache_->Key(b));

  ResetAssetCache(&storage_);
  EXPECT_EQ(key, asset_cache_->Key(identity));
}

TEST_F(AssetCacheTest, AddressedByIdentityOnly) {
  // Two texts with the same digest are the same asset as far as the cache
  // can tell.
  MockHasher content_hasher(GoogleString(AssetIdentity::kContentHashSize,
                                         'h'));
  MinifyRequest first(kCssLanguage, kCss,
                      AssetIdentity::Create("style", kCss, 1,
                                            &content_hasher));
  MinifyRequest second(kCssLanguage, "b { color : blue }",
                       AssetIdentity::Create("style", "b { color : blue }",
                                             1, &content_hasher));
  EXPECT_TRUE(first.identity().Equals(second.identity()));
  AssetCacheResult result;
  asset_cache_->PutIfAbsent(first, &result);
  EXPECT_FALSE(result.cache_hit);
  AssetCacheResult second_result;
  asset_cache_->PutIfAbsent(second, &second_result);
  EXPECT_TRUE(second_result.cache_hit);
  EXPECT_STREQ(kMinifiedCss, second_result.output_text);
}

TEST_F(AssetCacheTest, StageFailureIsStored) {
  AssetCacheResult first = Put(kJsLanguage, "broken", kBrokenJs, 1);
  EXPECT_FALSE(first.minified);
  EXPECT_EQ(kMalformedInput, first.status);
  EXPECT_TRUE(first.stored);
  EXPECT_STREQ(kBrokenJs, first.output_text);

  AssetCacheResult second = Put(kJsLanguage, "broken", kBrokenJs, 1);
  EXPECT_TRUE(second.cache_hit);
  EXPECT_STREQ(kBrokenJs, second.output_text);
  EXPECT_EQ(1, Stat(MinifyPipeline::kMinifyFallbacks));
}

TEST_F(AssetCacheTest, GuardFallbackIsNotStored) {
  options_.set_max_input_bytes(10);
  AssetCacheResult result = PutCss();
  EXPECT_FALSE(result.minified);
  EXPECT_EQ(kSizeLimitExceeded, result.status);
  EXPECT_FALSE(result.stored);
  EXPECT_STREQ(kCss, result.output_text);
  CheckUsage(0, 0);

  // Once the configuration allows it, the same asset is minified.
  options_.set_max_input_bytes(MinifyOptions::kDefaultMaxInputBytes);
  result = PutCss();
  EXPECT_FALSE(result.cache_hit);
  EXPECT_STREQ(kMinifiedCss, result.output_text);
}

TEST_F(AssetCacheTest, WriteFailureStillServes) {
  storage_.set_fail_puts(true);
  AssetCacheResult result = PutCss();
  EXPECT_STREQ(kMinifiedCss, result.output_text);
  EXPECT_TRUE(result.storage_write_failure);
  EXPECT_FALSE(result.stored);
  EXPECT_EQ(1, Stat(AssetCache::kWriteFailures));

  // Nothing was stored, so the next request computes again.
  storage_.set_fail_puts(false);
  result = PutCss();
  EXPECT_FALSE(result.cache_hit);
  EXPECT_TRUE(result.stored);
  EXPECT_EQ(2, Stat(AssetCache::kMisses));
  EXPECT_EQ(1, handler_.MessagesOfType(kWarning));
}

TEST_F(AssetCacheTest, ReadFailureIsMiss) {
  PutCss();
  storage_.set_fail_gets(true);
  AssetCacheResult result = PutCss();
  EXPECT_FALSE(result.cache_hit);
  EXPECT_TRUE(result.storage_read_failure);
  EXPECT_STREQ(kMinifiedCss, result.output_text);
  EXPECT_EQ(1, Stat(AssetCache::kReadFailures));
  EXPECT_EQ(2, Stat(MinifyPipeline::kMinifySuccesses));

  GoogleString text;
  EXPECT_FALSE(asset_cache_->Get(Identity("style", kCss, 100), &text));
  EXPECT_EQ(2, Stat(AssetCache::kReadFailures));
}

TEST_F(AssetCacheTest, DeleteAndClear) {
  PutCss();
  Put(kJsLanguage, "app", "var a = true;", 1);
  CheckUsage(2, STATIC_STRLEN(kMinifiedCss) + STATIC_STRLEN("var a=!0;"));

  asset_cache_->Delete(Identity("style", kCss, 100));
  CheckUsage(1, STATIC_STRLEN("var a=!0;"));
  EXPECT_FALSE(PutCss().cache_hit);

  EXPECT_TRUE(asset_cache_->Clear());
  CheckUsage(0, 0);
  EXPECT_FALSE(Put(kJsLanguage, "app", "var a = true;", 1).cache_hit);
}

TEST_F(AssetCacheTest, MalformedContentHashIsNotCached) {
  MinifyRequest request(kCssLanguage, kCss, AssetIdentity("style", "x", 1));
  AssetCacheResult result;
  asset_cache_->PutIfAbsent(request, &result);
  EXPECT_TRUE(result.minified);
  EXPECT_STREQ(kMinifiedCss, result.output_text);
  EXPECT_FALSE(result.stored);
  CheckUsage(0, 0);
  GoogleString text;
  EXPECT_FALSE(asset_cache_->Get(request.identity(), &text));
  EXPECT_HAS_SUBSTR("malformed content hash", handler_.buffer());
}

TEST_F(AssetCacheTest, FileBackedSurvivesRestart) {
  StdioFileSystem file_system;
  GoogleString path = StrCat(GTestTempDir(), "/asset_cache_test");
  FileCache file_cache(path, &file_system, &hasher_, &stats_, &handler_);
  ASSERT_TRUE(file_cache.Clear());
  ResetAssetCache(&file_cache);
  EXPECT_TRUE(PutCss().stored);

  FileCache reopened(path, &file_system, &hasher_, &stats_, &handler_);
  ResetAssetCache(&reopened);
  AssetCacheResult result = PutCss();
  EXPECT_TRUE(result.cache_hit);
  EXPECT_STREQ(kMinifiedCss, result.output_text);
  EXPECT_EQ(1, Stat(FileCache::kWrites));
  EXPECT_TRUE(asset_cache_->Clear());
  asset_cache_.reset(NULL);
}

class PutThread : public ThreadSystem::Thread {
 public:
  PutThread(ThreadSystem* runtime, AssetCache* cache,
            const MinifyRequest* request)
      : Thread(runtime, "put", ThreadSystem::kJoinable),
        cache_(cache),
        request_(request) {
  }

  void Run() override {
    cache_->PutIfAbsent(*request_, &result_);
  }

  const AssetCacheResult& result() const { return result_; }

 private:
  AssetCache* cache_;
  const MinifyRequest* request_;
  AssetCacheResult result_;
};

TEST_F(AssetCacheTest, ConcurrentPutsStoreOneEntry) {
  MinifyRequest request(kCssLanguage, kCss, Identity("style", kCss, 100));
  PutThread a(thread_system_.get(), asset_cache_.get(), &request);
  PutThread b(thread_system_.get(), asset_cache_.get(), &request);
  ASSERT_TRUE(a.Start());
  ASSERT_TRUE(b.Start());
  EXPECT_TRUE(a.Join());
  EXPECT_TRUE(b.Join());
  EXPECT_STREQ(kMinifiedCss, a.result().output_text);
  EXPECT_STREQ(kMinifiedCss, b.result().output_text);
  EXPECT_EQ(2, Stat(AssetCache::kHits) + Stat(AssetCache::kMisses));
  CheckUsage(1, STATIC_STRLEN(kMinifiedCss));
}

}  // namespace

}  // namespace assetspeed
