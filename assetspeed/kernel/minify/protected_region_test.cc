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


#include "assetspeed/kernel/minify/protected_region.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

namespace {

TEST(RegionMapTest, AddNumbersPlaceholders) {
  RegionMap regions;
  EXPECT_TRUE(regions.empty());
  EXPECT_STREQ("___STRING_0___", regions.Add(kStringLiteral, "'a'"));
  EXPECT_STREQ("___REGEX_1___", regions.Add(kRegexLiteral, "/b/g"));
  EXPECT_STREQ("___COMMENT_2___", regions.Add(kImportantComment, "/*! c */"));
  ASSERT_EQ(3, regions.size());
  EXPECT_EQ(kRegexLiteral, regions.region(1).kind);
  EXPECT_STREQ("/b/g", regions.region(1).original_text);
  regions.Clear();
  EXPECT_TRUE(regions.empty());
  EXPECT_STREQ("___CALC_0___", regions.Add(kCalcExpr, "calc(1px + 2px)"));
}

TEST(RegionMapTest, ParsePlaceholder) {
  RegionKind kind = kStringLiteral;
  int index = -1;
  EXPECT_EQ(13U, RegionMap::ParsePlaceholder("___CALC_12___rest", &kind,
                                             &index));
  EXPECT_EQ(kCalcExpr, kind);
  EXPECT_EQ(12, index);
  EXPECT_EQ(15U, RegionMap::ParsePlaceholder("___DATAURI_0___", &kind,
                                             &index));
  EXPECT_EQ(kDataUri, kind);
  EXPECT_EQ(0U, RegionMap::ParsePlaceholder("___FOO_1___", &kind, &index));
  EXPECT_EQ(0U, RegionMap::ParsePlaceholder("___STRING_x___", &kind,
                                            &index));
  EXPECT_EQ(0U, RegionMap::ParsePlaceholder("__STRING_0___", &kind, &index));
  EXPECT_EQ(0U, RegionMap::ParsePlaceholder("___STRING_0__", &kind, &index));
  EXPECT_EQ(0U, RegionMap::ParsePlaceholder("___STRING____", &kind, &index));
  EXPECT_EQ(0U, RegionMap::ParsePlaceholder("___STRING_1234567890___",
                                            &kind, &index));
  EXPECT_EQ(0U, RegionMap::ParsePlaceholder("", &kind, &index));
}

TEST(RegionMapTest, FindAtStart) {
  RegionMap regions;
  regions.Add(kStringLiteral, "\"x\"");
  size_t length = 0;
  const ProtectedRegion* region =
      regions.FindAtStart("___STRING_0___;", &length);
  ASSERT_TRUE(region != NULL);
  EXPECT_EQ(14U, length);
  EXPECT_STREQ("\"x\"", region->original_text);
  // Wrong kind for the index, or an index past the end.
  EXPECT_TRUE(regions.FindAtStart("___REGEX_0___", &length) == NULL);
  EXPECT_TRUE(regions.FindAtStart("___STRING_1___", &length) == NULL);
  EXPECT_TRUE(regions.FindAtStart("x___STRING_0___", &length) == NULL);
}

TEST(RegionMapTest, Restore) {
  RegionMap regions;
  regions.Add(kStringLiteral, "'a  b'");
  regions.Add(kRegexLiteral, "/c/g");
  GoogleString out("prefix:");
  regions.Restore("x=___STRING_0___;return___REGEX_1___.test(y)", &out);
  EXPECT_STREQ("prefix:x='a  b';return/c/g.test(y)", out);
}

TEST(RegionMapTest, RestoreLeavesForeignText) {
  RegionMap regions;
  regions.Add(kStringLiteral, "'a'");
  GoogleString out;
  regions.Restore("___STRING_9___ ____STRING_0___ ___ __x", &out);
  EXPECT_STREQ("___STRING_9___ _'a' ___ __x", out);
}

TEST(RegionMapTest, RestoreEmpty) {
  RegionMap regions;
  GoogleString out;
  regions.Restore("", &out);
  EXPECT_TRUE(out.empty());
  regions.Restore("a{color:red}", &out);
  EXPECT_STREQ("a{color:red}", out);
}

TEST(RegionMapTest, ContainsPlaceholderSyntax) {
  EXPECT_TRUE(RegionMap::ContainsPlaceholderSyntax("x=___STRING_0___"));
  EXPECT_TRUE(RegionMap::ContainsPlaceholderSyntax("a___URL_15___b"));
  EXPECT_FALSE(RegionMap::ContainsPlaceholderSyntax("var ___ = 1"));
  EXPECT_FALSE(RegionMap::ContainsPlaceholderSyntax("___string_0___"));
  EXPECT_FALSE(RegionMap::ContainsPlaceholderSyntax("___OTHER_0___"));
  EXPECT_FALSE(RegionMap::ContainsPlaceholderSyntax(""));
}

TEST(RegionMapTest, PlaceholderNames) {
  EXPECT_STREQ("COMMENT", RegionKindPlaceholderName(kImportantComment));
  EXPECT_STREQ("TEMPLATE", RegionKindPlaceholderName(kTemplateLiteral));
  EXPECT_STREQ("URL", RegionKindPlaceholderName(kUrlReference));
}

}  // namespace

}  // namespace assetspeed
