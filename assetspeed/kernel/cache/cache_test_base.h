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


// Shared infrastructure for testing cache implementations

#ifndef ASSETSPEED_KERNEL_CACHE_CACHE_TEST_BASE_H_
#define ASSETSPEED_KERNEL_CACHE_CACHE_TEST_BASE_H_

#include <vector>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/cache/cache_interface.h"

namespace assetspeed {

class CacheTestBase : public testing::Test {
 public:
  // Helper class for calling Get on cache implementations that are blocking
  // in nature.  Also tests the CacheInterface::SynchronousCallback class in
  // the process.
  class Callback : public CacheInterface::SynchronousCallback {
   public:
    Callback() { Reset(); }
    ~Callback() override {}
    Callback* Reset() {
      SynchronousCallback::Reset();
      validate_called_ = false;
      invalid_value_ = NULL;
      return this;
    }

    bool ValidateCandidate(const GoogleString& key,
                           CacheInterface::KeyState state) override {
      validate_called_ = true;
      if ((invalid_value_ != NULL) && (value() == invalid_value_)) {
        return false;
      }
      return true;
    }

    void set_invalid_value(const char* v) { invalid_value_ = v; }

    bool validate_called_;

   private:
    const char* invalid_value_;

    DISALLOW_COPY_AND_ASSIGN(Callback);
  };

 protected:
  CacheTestBase() : invalid_value_(NULL) {}
  ~CacheTestBase() override {
    for (int i = 0, n = callbacks_.size(); i < n; ++i) {
      delete callbacks_[i];
    }
  }

  virtual CacheInterface* Cache() = 0;

  // Performs a cache Get and checks the result is as expected.
  void CheckGet(const GoogleString& key, const GoogleString& expected_value) {
    Callback* callback = InitiateGet(key);
    ASSERT_TRUE(callback->called());
    EXPECT_TRUE(callback->validate_called_);
    EXPECT_STREQ(expected_value, callback->value());
    EXPECT_EQ(CacheInterface::kAvailable, callback->state());
  }

  // Writes a value into the cache, expecting success.
  void CheckPut(const GoogleString& key, const GoogleString& value) {
    EXPECT_TRUE(Cache()->Put(key, value));
  }

  void CheckDelete(const GoogleString& key) {
    Cache()->Delete(key);
  }

  // Performs a Get and verifies that the key is not found.
  void CheckNotFound(const GoogleString& key) {
    CheckState(key, CacheInterface::kNotFound);
  }

  void CheckState(const GoogleString& key, CacheInterface::KeyState state) {
    Callback* callback = InitiateGet(key);
    ASSERT_TRUE(callback->called());
    EXPECT_EQ(state, callback->state())
        << CacheInterface::KeyStateName(callback->state());
  }

  void CheckUsage(int64 expected_entries, int64 expected_bytes) {
    CacheUsage usage;
    ASSERT_TRUE(Cache()->GetUsage(&usage));
    EXPECT_EQ(expected_entries, usage.entry_count);
    EXPECT_EQ(expected_bytes, usage.total_bytes);
  }

  // Populates the cache with keys in pattern n0 n1 n2 n3...
  // and values in pattern v0 v1 v2 v3...
  void PopulateCache(int num) {
    for (int i = 0; i < num; ++i) {
      CheckPut(StringPrintf("n%d", i), StringPrintf("v%d", i));
    }
  }

  void set_invalid_value(const char* v) { invalid_value_ = v; }

  Callback* InitiateGet(const GoogleString& key) {
    Callback* callback = new Callback;
    callback->set_invalid_value(invalid_value_);
    callbacks_.push_back(callback);
    Cache()->Get(key, callback);
    return callback;
  }

  // The operations every implementation supports the same way.
  void TestPutGetDelete() {
    CheckPut("Name", "Value");
    CheckGet("Name", "Value");
    CheckNotFound("Another Name");

    CheckPut("Name", "NewValue");
    CheckGet("Name", "NewValue");

    CheckDelete("Name");
    CheckNotFound("Name");
    // Deleting a missing key is harmless.
    CheckDelete("Name");
  }

  void TestInvalid() {
    CheckPut("nameA", "valueA");
    CheckPut("nameB", "valueB");
    set_invalid_value("valueA");
    CheckNotFound("nameA");
    CheckGet("nameB", "valueB");
  }

  void TestClearAndUsage() {
    CheckUsage(0, 0);
    PopulateCache(3);
    CheckPut("empty", "");
    CheckUsage(4, 6);
    CheckGet("empty", "");
    EXPECT_TRUE(Cache()->Clear());
    CheckUsage(0, 0);
    CheckNotFound("n0");
    CheckNotFound("empty");
  }

 private:
  const char* invalid_value_;  // may be NULL.
  std::vector<Callback*> callbacks_;

  DISALLOW_COPY_AND_ASSIGN(CacheTestBase);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_CACHE_CACHE_TEST_BASE_H_
