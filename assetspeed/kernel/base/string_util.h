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

#ifndef ASSETSPEED_KERNEL_BASE_STRING_UTIL_H_
#define ASSETSPEED_KERNEL_BASE_STRING_UTIL_H_

#include <cstdarg>
#include <set>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/printf_format.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

typedef std::set<GoogleString> StringSet;
typedef std::vector<GoogleString> StringVector;
typedef std::vector<StringPiece> StringPieceVector;

using absl::StrAppend;
using absl::StrCat;

// Length of a string literal, without the terminating NUL.
#define STATIC_STRLEN(static_string) (arraysize(static_string) - 1)

inline GoogleString IntegerToString(int i) {
  return absl::StrCat(i);
}

inline GoogleString Integer64ToString(int64 i) {
  return absl::StrCat(i);
}

// Parses a base-10 integer, rejecting surrounding junk.  Returns false
// and leaves *out untouched on failure.
bool StringToInt64(StringPiece in, int64* out);

GoogleString StringPrintf(const char* format, ...)
    ASSETSPEED_PRINTF_FORMAT(1, 2);
void StringAppendV(GoogleString* dst, const char* format, va_list ap);

// Splits sp on any of the separator characters.  Empty pieces are dropped
// when omit_empty_strings is true.
void SplitStringPieceToVector(StringPiece sp, StringPiece separators,
                              StringPieceVector* components,
                              bool omit_empty_strings);

// Removes leading and trailing ASCII whitespace, returning true if anything
// was removed.
bool TrimWhitespace(StringPiece* str);

inline bool IsHtmlSpace(char c) {
  return (c == ' ') || (c == '\t') || (c == '\r') || (c == '\n') ||
      (c == '\f');
}

inline bool IsDecimalDigit(char c) {
  return (c >= '0') && (c <= '9');
}

inline bool IsHexDigit(char c) {
  return IsDecimalDigit(c) || ((c >= 'a') && (c <= 'f')) ||
      ((c >= 'A') && (c <= 'F'));
}

inline bool IsAsciiAlpha(char c) {
  return ((c >= 'a') && (c <= 'z')) || ((c >= 'A') && (c <= 'Z'));
}

inline char LowerChar(char c) {
  return ((c >= 'A') && (c <= 'Z')) ? (c + ('a' - 'A')) : c;
}

void LowerString(GoogleString* str);

inline bool StringCaseEqual(StringPiece s1, StringPiece s2) {
  return absl::EqualsIgnoreCase(s1, s2);
}

inline bool StringCaseEndsWith(StringPiece str, StringPiece suffix) {
  return absl::EndsWithIgnoreCase(str, suffix);
}

inline bool HasPrefixString(StringPiece str, StringPiece prefix) {
  return absl::StartsWith(str, prefix);
}

// Appends a trailing slash to dir unless it already has one.
inline void EnsureEndsInSlash(GoogleString* dir) {
  if (dir->empty() || (*dir)[dir->size() - 1] != '/') {
    dir->push_back('/');
  }
}

// Returns the offset of needle in haystack ignoring ASCII case, or
// StringPiece::npos.
size_t FindIgnoreCase(StringPiece haystack, StringPiece needle);

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_STRING_UTIL_H_
