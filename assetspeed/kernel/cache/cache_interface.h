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


#ifndef ASSETSPEED_KERNEL_CACHE_CACHE_INTERFACE_H_
#define ASSETSPEED_KERNEL_CACHE_CACHE_INTERFACE_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

// Number of entries and bytes of stored values.
struct CacheUsage {
  CacheUsage() : entry_count(0), total_bytes(0) {}

  int64 entry_count;
  int64 total_bytes;
};

// Abstract interface for a key/value store of cached assets.
class CacheInterface {
 public:
  enum KeyState {
    kAvailable = 0,  // Requested key is available for serving
    kNotFound = 1,   // Requested key needs to be written
    kReadError = 2,  // An entry exists but could not be read
  };

  class Callback {
   public:
    virtual ~Callback();
    const GoogleString& value() const { return value_; }
    GoogleString* mutable_value() { return &value_; }

   protected:
    friend class CacheInterface;

    // Lets cache clients veto a candidate value for semantic reasons.
    // Returning false turns the lookup into a kNotFound.
    //
    // Note that implementations may not invoke any cache operations,
    // as it may be invoked with locks held.
    virtual bool ValidateCandidate(const GoogleString& key,
                                   KeyState state) { return true; }

    // Called once the lookup is complete.  Implementations are free to
    // invoke cache operations, as all cache locks are released.
    virtual void Done(KeyState state) = 0;

   private:
    GoogleString value_;
  };

  // Helper class for use with implementations for which IsBlocking is true.
  // It simply saves the state, value, and whether Done() has been called.
  class SynchronousCallback : public Callback {
   public:
    SynchronousCallback() { Reset(); }

    bool called() const { return called_; }
    KeyState state() const { return state_; }

    void Reset() {
      called_ = false;
      state_ = CacheInterface::kNotFound;
      mutable_value()->clear();
    }

    void Done(CacheInterface::KeyState state) override {
      called_ = true;
      state_ = state;
    }

   private:
    bool called_;
    CacheInterface::KeyState state_;

    DISALLOW_COPY_AND_ASSIGN(SynchronousCallback);
  };

  static const char* KeyStateName(KeyState state);

  CacheInterface() {}
  virtual ~CacheInterface();

  // Initiates a cache fetch, calling callback->ValidateCandidate()
  // and then callback->Done(state) when done.
  virtual void Get(const GoogleString& key, Callback* callback) = 0;

  // Stores value under key, replacing any previous value.  Returns false
  // if the value could not be stored.
  virtual bool Put(const GoogleString& key, StringPiece value) = 0;
  virtual void Delete(const GoogleString& key) = 0;

  // Removes every entry.  Returns false if some entry could not be
  // removed.
  virtual bool Clear() = 0;

  // Fills in *usage.  Returns false if the store could not be inspected.
  virtual bool GetUsage(CacheUsage* usage) = 0;

  // The name of this CacheInterface -- used for logging and debugging.
  virtual GoogleString Name() const = 0;

  // Returns true if this cache is guaranteed to call its callbacks before
  // returning from Get.
  virtual bool IsBlocking() const = 0;

  // A rough estimation of whether cache is available for any operations.
  virtual bool IsHealthy() const = 0;

  // Stops all cache activity.  Further Put/Delete calls will be dropped, and
  // Get will call the callback with kNotFound immediately.  Once the cache
  // is stopped it is stopped forever.
  virtual void ShutDown() = 0;

 protected:
  // Invokes callback->ValidateCandidate() and callback->Done() as appropriate.
  void ValidateAndReportResult(const GoogleString& key, KeyState state,
                               Callback* callback);

 private:
  DISALLOW_COPY_AND_ASSIGN(CacheInterface);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_CACHE_CACHE_INTERFACE_H_
