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


#ifndef ASSETSPEED_KERNEL_BASE_GTEST_H_
#define ASSETSPEED_KERNEL_BASE_GTEST_H_

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "gtest/gtest.h"

namespace assetspeed {

// A per-process scratch directory under /tmp.  It is not created.
GoogleString GTestTempDir();

}  // namespace assetspeed

namespace testing {
namespace internal {

// Allows EXPECT_STREQ to be used on StringPiece.
inline AssertionResult CmpHelperSTREQ(
    const char* expected_expression,
    const char* actual_expression,
    StringPiece expected,
    StringPiece actual) {
  return CmpHelperSTREQ(expected_expression, actual_expression,
                        GoogleString(expected).c_str(),
                        GoogleString(actual).c_str());
}

// Allows EXPECT_STRNE to be used on StringPiece.
inline AssertionResult CmpHelperSTRNE(
    const char* expected_expression,
    const char* actual_expression,
    StringPiece expected,
    StringPiece actual) {
  return CmpHelperSTRNE(expected_expression, actual_expression,
                        GoogleString(expected).c_str(),
                        GoogleString(actual).c_str());
}

// EXPECT_HAS_SUBSTR and EXPECT_HAS_SUBSTR_NE allows a simple way to search
// for a substring. Works on StringPiece, char* and GoogleString.
#define EXPECT_HAS_SUBSTR(needle, haystack) \
  EXPECT_PRED_FORMAT2(::testing::internal::CmpHelperSUBSTR, needle, haystack)

#define EXPECT_HAS_SUBSTR_NE(needle, haystack) \
  EXPECT_PRED_FORMAT2(::testing::internal::CmpHelperSUBSTRNE, needle, haystack)

inline AssertionResult CmpHelperSUBSTR(
    const char* needle_expression,
    const char* haystack_expression,
    StringPiece needle,
    StringPiece haystack) {
  return ::testing::IsSubstring(needle_expression, haystack_expression,
                                GoogleString(needle), GoogleString(haystack));
}

inline AssertionResult CmpHelperSUBSTRNE(
    const char* needle_expression,
    const char* haystack_expression,
    StringPiece needle,
    StringPiece haystack) {
  return ::testing::IsNotSubstring(needle_expression, haystack_expression,
                                   GoogleString(needle),
                                   GoogleString(haystack));
}

}  // namespace internal
}  // namespace testing

#endif  // ASSETSPEED_KERNEL_BASE_GTEST_H_
