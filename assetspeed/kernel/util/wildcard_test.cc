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


#include "assetspeed/kernel/util/wildcard.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/scoped_ptr.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class WildcardTest : public testing::Test {
 protected:
  bool WildcardMatch(StringPiece spec, StringPiece str) {
    Wildcard wildcard(spec);
    EXPECT_EQ(spec, wildcard.spec());
    scoped_ptr<Wildcard> duplicate(wildcard.Duplicate());
    bool is_simple = spec.find_first_of("*?") == StringPiece::npos;
    EXPECT_EQ(is_simple, wildcard.IsSimple());
    bool result = wildcard.Match(str);
    EXPECT_EQ(wildcard.spec(), duplicate->spec());
    EXPECT_EQ(result, duplicate->Match(str));
    return result;
  }
};

TEST_F(WildcardTest, Identity) {
  EXPECT_TRUE(WildcardMatch("jquery-core", "jquery-core"));
  EXPECT_FALSE(WildcardMatch("jquery-core", "xjquery-core"));
  EXPECT_FALSE(WildcardMatch("jquery-core", "jquery-corex"));
}

TEST_F(WildcardTest, OneStar) {
  EXPECT_TRUE(WildcardMatch("wp-*-js", "wp-embed-js"));
  EXPECT_TRUE(WildcardMatch("wp-*-js", "wp--js"));
  EXPECT_FALSE(WildcardMatch("wp-*-js", "wp-js"));
}

TEST_F(WildcardTest, Questions) {
  EXPECT_TRUE(WildcardMatch("H?llo", "Hello"));
  EXPECT_TRUE(WildcardMatch("H???o", "Hello"));
  EXPECT_FALSE(WildcardMatch("Hello?", "Hello"));
  EXPECT_FALSE(WildcardMatch("?Hello", "Hello"));
}

TEST_F(WildcardTest, GreedyTrap) {
  EXPECT_TRUE(WildcardMatch("*abcd", "abcabcabcabcabcd"));
  EXPECT_FALSE(WildcardMatch("*abcd?", "abcabcabcabcabcd"));
  EXPECT_TRUE(WildcardMatch("*abcd*", "abcabcabcabcabcd"));
  EXPECT_TRUE(WildcardMatch("**goo?le*", "ogoodgooglers"));
}

TEST_F(WildcardTest, RegexpMetacharactersAreLiteral) {
  EXPECT_TRUE(WildcardMatch("*.min.js", "/wp-includes/js/jquery.min.js"));
  EXPECT_FALSE(WildcardMatch("*.min.js", "/wp-includes/js/jquery-min-js"));
  EXPECT_TRUE(WildcardMatch("a+b(c)*", "a+b(c)[d]"));
  EXPECT_FALSE(WildcardMatch("a+b*", "aab"));
}

TEST_F(WildcardTest, Empty) {
  EXPECT_TRUE(WildcardMatch("", ""));
  EXPECT_FALSE(WildcardMatch("", "x"));
  EXPECT_TRUE(WildcardMatch("*", ""));
  EXPECT_FALSE(WildcardMatch("?", ""));
}

TEST_F(WildcardTest, StarMatchesNewlines) {
  EXPECT_TRUE(WildcardMatch("a*b", "a\nb"));
}

}  // namespace assetspeed
