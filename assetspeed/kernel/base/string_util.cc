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

#include <cstdarg>
#include <cstdio>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

bool StringToInt64(StringPiece in, int64* out) {
  int64 value;
  if (in.empty() || IsHtmlSpace(in[0]) || IsHtmlSpace(in[in.size() - 1]) ||
      !absl::SimpleAtoi(in, &value)) {
    return false;
  }
  *out = value;
  return true;
}

void StringAppendV(GoogleString* dst, const char* format, va_list ap) {
  // First try with a small fixed size buffer.
  char space[1024];

  // It's possible for methods that use a va_list to invalidate the data in
  // it upon use.  The fix is to make a copy of the structure before using
  // it and use that copy instead.
  va_list backup_ap;
  va_copy(backup_ap, ap);
  int result = vsnprintf(space, sizeof(space), format, backup_ap);
  va_end(backup_ap);

  if ((result >= 0) && (result < static_cast<int>(sizeof(space)))) {
    dst->append(space, result);
    return;
  }
  if (result < 0) {
    // Formatting error; leave dst alone.
    return;
  }

  // Retry with exactly the reported length.
  GoogleString buf(result + 1, '\0');
  va_copy(backup_ap, ap);
  result = vsnprintf(&buf[0], buf.size(), format, backup_ap);
  va_end(backup_ap);
  if ((result >= 0) && (result < static_cast<int>(buf.size()))) {
    dst->append(buf.data(), result);
  }
}

GoogleString StringPrintf(const char* format, ...) {
  va_list ap;
  va_start(ap, format);
  GoogleString result;
  StringAppendV(&result, format, ap);
  va_end(ap);
  return result;
}

void SplitStringPieceToVector(StringPiece sp, StringPiece separators,
                              StringPieceVector* components,
                              bool omit_empty_strings) {
  size_t prev_pos = 0;
  size_t pos = 0;
  while ((pos = sp.find_first_of(separators, pos)) != StringPiece::npos) {
    if (!omit_empty_strings || (pos > prev_pos)) {
      components->push_back(sp.substr(prev_pos, pos - prev_pos));
    }
    ++pos;
    prev_pos = pos;
  }
  if (!omit_empty_strings || (prev_pos < sp.size())) {
    components->push_back(sp.substr(prev_pos));
  }
}

bool TrimWhitespace(StringPiece* str) {
  size_t orig_size = str->size();
  while (!str->empty() && IsHtmlSpace((*str)[0])) {
    str->remove_prefix(1);
  }
  while (!str->empty() && IsHtmlSpace((*str)[str->size() - 1])) {
    str->remove_suffix(1);
  }
  return str->size() != orig_size;
}

void LowerString(GoogleString* str) {
  absl::AsciiStrToLower(str);
}

size_t FindIgnoreCase(StringPiece haystack, StringPiece needle) {
  if (needle.size() > haystack.size()) {
    return StringPiece::npos;
  }
  for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
    if (StringCaseEqual(haystack.substr(i, needle.size()), needle)) {
      return i;
    }
  }
  return StringPiece::npos;
}

}  // namespace assetspeed
