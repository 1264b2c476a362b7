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


// Unit-test in-memory cache

#include "assetspeed/kernel/cache/in_memory_cache.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/null_mutex.h"
#include "assetspeed/kernel/cache/cache_test_base.h"

namespace assetspeed {

class InMemoryCacheTest : public CacheTestBase {
 protected:
  InMemoryCacheTest() : cache_(new NullMutex) {}

  CacheInterface* Cache() override { return &cache_; }

  InMemoryCache cache_;

 private:
  DISALLOW_COPY_AND_ASSIGN(InMemoryCacheTest);
};

// Simple flow of putting in an item, getting it, deleting it.
TEST_F(InMemoryCacheTest, PutGetDelete) {
  TestPutGetDelete();
}

TEST_F(InMemoryCacheTest, DetachesValueOnPut) {
  GoogleString s("Value");
  Cache()->Put("Name", s);
  s[0] = '-';
  CheckGet("Name", "Value");
}

TEST_F(InMemoryCacheTest, BasicInvalid) {
  // Check that we honor callback veto on validity.
  TestInvalid();
}

TEST_F(InMemoryCacheTest, ClearAndUsage) {
  TestClearAndUsage();
}

TEST_F(InMemoryCacheTest, DoesNotGetAfterShutdown) {
  CheckPut("Name", "Value");
  CheckGet("Name", "Value");
  EXPECT_TRUE(Cache()->IsHealthy());
  Cache()->ShutDown();
  EXPECT_FALSE(Cache()->IsHealthy());
  CheckNotFound("Name");
  EXPECT_FALSE(Cache()->Put("Other", "Value"));
}

}  // namespace assetspeed
