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


#include "assetspeed/kernel/base/string_util.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

namespace {

TEST(StringUtilTest, IntegerConversions) {
  EXPECT_EQ("42", IntegerToString(42));
  EXPECT_EQ("-7", IntegerToString(-7));
  EXPECT_EQ("1700000000123", Integer64ToString(1700000000123LL));

  int64 value = 5;
  EXPECT_TRUE(StringToInt64("1048576", &value));
  EXPECT_EQ(1048576, value);
  EXPECT_TRUE(StringToInt64("-12", &value));
  EXPECT_EQ(-12, value);
  EXPECT_FALSE(StringToInt64("", &value));
  EXPECT_FALSE(StringToInt64(" 12", &value));
  EXPECT_FALSE(StringToInt64("12k", &value));
  EXPECT_EQ(-12, value);
}

TEST(StringUtilTest, StringPrintf) {
  EXPECT_EQ("a-1-b", StringPrintf("%s-%d-%s", "a", 1, "b"));
  GoogleString long_arg(5000, 'x');
  EXPECT_EQ(long_arg + "!", StringPrintf("%s!", long_arg.c_str()));
}

TEST(StringUtilTest, Split) {
  StringPieceVector pieces;
  SplitStringPieceToVector("a,,b;c", ",;", &pieces, true);
  ASSERT_EQ(3U, pieces.size());
  EXPECT_EQ("a", pieces[0]);
  EXPECT_EQ("b", pieces[1]);
  EXPECT_EQ("c", pieces[2]);

  pieces.clear();
  SplitStringPieceToVector("a,,b", ",", &pieces, false);
  ASSERT_EQ(3U, pieces.size());
  EXPECT_EQ("", pieces[1]);
}

TEST(StringUtilTest, TrimWhitespace) {
  StringPiece str(" \t MinifyCss on\r\n");
  EXPECT_TRUE(TrimWhitespace(&str));
  EXPECT_EQ("MinifyCss on", str);
  EXPECT_FALSE(TrimWhitespace(&str));
  StringPiece blank(" \n ");
  EXPECT_TRUE(TrimWhitespace(&blank));
  EXPECT_TRUE(blank.empty());
}

TEST(StringUtilTest, CaseHelpers) {
  EXPECT_TRUE(StringCaseEqual("MinifyCss", "minifycss"));
  EXPECT_FALSE(StringCaseEqual("MinifyCss", "MinifyJs"));
  EXPECT_TRUE(StringCaseEndsWith("jquery.MIN.js", ".min.js"));
  EXPECT_TRUE(HasPrefixString("--main-color", "--"));
  GoogleString str("PX");
  LowerString(&str);
  EXPECT_EQ("px", str);
  EXPECT_EQ(3U, FindIgnoreCase("a{PROGID:DXImage}", "progid:"));
  EXPECT_EQ(StringPiece::npos, FindIgnoreCase("abc", "abcd"));
}

TEST(StringUtilTest, EnsureEndsInSlash) {
  GoogleString dir("/tmp/cache");
  EnsureEndsInSlash(&dir);
  EXPECT_EQ("/tmp/cache/", dir);
  EnsureEndsInSlash(&dir);
  EXPECT_EQ("/tmp/cache/", dir);
}

TEST(StringUtilTest, CharClasses) {
  EXPECT_TRUE(IsHtmlSpace('\f'));
  EXPECT_FALSE(IsHtmlSpace('x'));
  EXPECT_TRUE(IsHexDigit('F'));
  EXPECT_FALSE(IsHexDigit('g'));
  EXPECT_TRUE(IsDecimalDigit('7'));
  EXPECT_TRUE(IsAsciiAlpha('Q'));
  EXPECT_EQ('q', LowerChar('Q'));
  EXPECT_EQ('#', LowerChar('#'));
}

}  // namespace

}  // namespace assetspeed
