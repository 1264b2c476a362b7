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


#include "assetspeed/kernel/util/sha1_hasher.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

namespace {

TEST(Sha1HasherTest, KnownDigests) {
  Sha1Hasher hasher;
  EXPECT_EQ(20, hasher.RawHashSizeInBytes());
  EXPECT_EQ("a9993e364706816aba3e25717850c26c9cd0d89d",
            Sha1Hasher::HexDigest(hasher.RawHash("abc")));
  EXPECT_EQ("da39a3ee5e6b4b0d3255bfef95601890afd80709",
            Sha1Hasher::HexDigest(hasher.RawHash("")));
}

TEST(Sha1HasherTest, HashIsTruncatedWeb64) {
  Sha1Hasher hasher;
  Sha1Hasher long_hasher(100);
  Sha1Hasher short_hasher(8);
  EXPECT_EQ(Sha1Hasher::kDefaultHashSize, hasher.HashSizeInChars());
  EXPECT_EQ(26, hasher.HashSizeInChars());
  EXPECT_EQ(8, short_hasher.HashSizeInChars());

  GoogleString full = long_hasher.Hash("body{color:red}");
  GoogleString hash = hasher.Hash("body{color:red}");
  EXPECT_EQ(26U, hash.size());
  EXPECT_EQ(0U, full.find(hash));
  EXPECT_EQ(hash.substr(0, 8), short_hasher.Hash("body{color:red}"));

  // Web-safe alphabet only.
  EXPECT_EQ(GoogleString::npos, full.find_first_of("+/="));
}

TEST(Sha1HasherTest, SensitiveToEveryByte) {
  Sha1Hasher hasher;
  EXPECT_NE(hasher.Hash("a {color:red}"), hasher.Hash("a {color:red} "));
  EXPECT_EQ(hasher.Hash("a {color:red}"), hasher.Hash("a {color:red}"));
}

}  // namespace

}  // namespace assetspeed
