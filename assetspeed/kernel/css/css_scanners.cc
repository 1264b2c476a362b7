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


#include "assetspeed/kernel/css/css_scanners.h"

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

namespace css {

namespace {

const char kUrlFunction[] = "url(";
const char kDataScheme[] = "data:";

const char* const kMathFunctions[] = {
  "calc(", "-webkit-calc(", "-moz-calc(", "clamp(", "min(", "max("
};

// Returns the length of the function name plus '(' if text starts with
// name, compared case-insensitively.
size_t MatchFunction(StringPiece text, StringPiece name) {
  if (text.size() >= name.size() &&
      StringCaseEqual(text.substr(0, name.size()), name)) {
    return name.size();
  }
  return 0;
}

size_t SkipSpaces(StringPiece input, size_t pos) {
  while (pos < input.size() && IsHtmlSpace(input[pos])) {
    ++pos;
  }
  return pos;
}

}  // namespace

RegionScanner::Result UrlScanner::Scan(
    StringPiece input, size_t pos, const LexicalContext& context,
    size_t* end, RegionKind* kind) const {
  size_t name_length = MatchFunction(input.substr(pos), kUrlFunction);
  if (name_length == 0) {
    return kNoMatch;
  }
  size_t payload_begin = SkipSpaces(input, pos + name_length);
  size_t payload_end;
  size_t i;
  if (payload_begin < input.size() &&
      (input[payload_begin] == '"' || input[payload_begin] == '\'')) {
    i = QuotedStringScanner::FindStringEnd(input, payload_begin);
    if (i == StringPiece::npos) {
      return kUnterminated;
    }
    // Skip the quote so the scheme test below sees the payload itself.
    ++payload_begin;
    payload_end = i;
    i = SkipSpaces(input, i);
    if (i >= input.size() || input[i] != ')') {
      return kUnterminated;
    }
  } else {
    i = payload_begin;
    while (i < input.size() && input[i] != ')') {
      if (input[i] == '\\') {
        ++i;
      } else if (input[i] == '\n' || input[i] == '\r') {
        return kUnterminated;
      }
      ++i;
    }
    if (i >= input.size()) {
      return kUnterminated;
    }
    payload_end = i;
  }
  StringPiece payload =
      input.substr(payload_begin, payload_end - payload_begin);
  *kind = (MatchFunction(payload, kDataScheme) != 0) ? kDataUri
                                                     : kUrlReference;
  *end = i + 1;
  return kMatched;
}

RegionScanner::Result CalcScanner::Scan(
    StringPiece input, size_t pos, const LexicalContext& context,
    size_t* end, RegionKind* kind) const {
  StringPiece rest = input.substr(pos);
  size_t name_length = 0;
  for (size_t i = 0; i < arraysize(kMathFunctions) && name_length == 0; ++i) {
    name_length = MatchFunction(rest, kMathFunctions[i]);
  }
  if (name_length == 0) {
    return kNoMatch;
  }
  int depth = 1;
  size_t i = pos + name_length;
  while (i < input.size()) {
    char c = input[i];
    if (c == '"' || c == '\'') {
      i = QuotedStringScanner::FindStringEnd(input, i);
      if (i == StringPiece::npos) {
        return kUnterminated;
      }
      continue;
    }
    if (c == '(') {
      ++depth;
    } else if (c == ')') {
      --depth;
      if (depth == 0) {
        *end = i + 1;
        *kind = kCalcExpr;
        return kMatched;
      }
    }
    ++i;
  }
  return kUnterminated;
}

GoogleString CalcScanner::ProtectedText(StringPiece matched,
                                        RegionKind kind) const {
  GoogleString out;
  out.reserve(matched.size());
  bool pending_space = false;
  size_t i = 0;
  while (i < matched.size()) {
    char c = matched[i];
    if (IsHtmlSpace(c)) {
      pending_space = true;
      ++i;
      continue;
    }
    if (pending_space && !out.empty() && out[out.size() - 1] != '(' &&
        c != ')') {
      out.push_back(' ');
    }
    pending_space = false;
    if (c == '"' || c == '\'') {
      // Scan already verified that every string is closed.
      size_t string_end = QuotedStringScanner::FindStringEnd(matched, i);
      out.append(matched.data() + i, string_end - i);
      i = string_end;
    } else {
      out.push_back(c);
      ++i;
    }
  }
  return out;
}

}  // namespace css

}  // namespace assetspeed
