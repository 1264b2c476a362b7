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
#ifndef ASSETSPEED_KERNEL_BASE_MOCK_HASHER_H_
#define ASSETSPEED_KERNEL_BASE_MOCK_HASHER_H_

#include <limits>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/hasher.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

// Hasher returning a fixed value, so tests can force collisions.
class MockHasher : public Hasher {
 public:
  MockHasher()
      : Hasher(std::numeric_limits<int>::max()),
        hash_value_("\xd0") {  // base64-encodes to "0"
  }

  explicit MockHasher(StringPiece hash_value)
      : Hasher(std::numeric_limits<int>::max()),
        hash_value_(hash_value.data(), hash_value.size()) {
  }

  ~MockHasher() override {}

  GoogleString RawHash(StringPiece content) const override {
    return hash_value_;
  }

  void set_hash_value(const GoogleString& new_hash_value) {
    hash_value_ = new_hash_value;
  }

  int RawHashSizeInBytes() const override { return hash_value_.length(); }

 private:
  GoogleString hash_value_;

  DISALLOW_COPY_AND_ASSIGN(MockHasher);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_MOCK_HASHER_H_
