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


#include "assetspeed/kernel/js/js_scanners.h"

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/minify/minify_status.h"

namespace assetspeed {

namespace js {

namespace {

// Scans the substitution whose '{' is at input[pos].  Returns the offset
// of the matching '}', or npos.
size_t FindSubstitutionEnd(StringPiece input, size_t pos) {
  int depth = 1;
  size_t i = pos + 1;
  while (i < input.size()) {
    char c = input[i];
    if (c == '"' || c == '\'') {
      i = QuotedStringScanner::FindStringEnd(input, i);
    } else if (c == '`') {
      i = TemplateScanner::FindTemplateEnd(input, i);
    } else {
      if (c == '{') {
        ++depth;
      } else if (c == '}') {
        --depth;
        if (depth == 0) {
          return i;
        }
      }
      ++i;
    }
    if (i == StringPiece::npos) {
      return StringPiece::npos;
    }
  }
  return StringPiece::npos;
}

}  // namespace

RegionScanner::Result ConditionalCommentScanner::Scan(
    StringPiece input, size_t pos, const LexicalContext& context,
    size_t* end, RegionKind* kind) const {
  if (!HasPrefixString(input.substr(pos), "/*@")) {
    return kNoMatch;
  }
  size_t close = input.find("*/", pos + 3);
  if (close == StringPiece::npos) {
    return kUnterminated;
  }
  // Only /*@ ... @*/ is conditional; anything else is an ordinary comment.
  if (input[close - 1] != '@' || close - 1 < pos + 3) {
    return kNoMatch;
  }
  *end = close + 2;
  *kind = kImportantComment;
  return kMatched;
}

size_t TemplateScanner::FindTemplateEnd(StringPiece input, size_t pos) {
  size_t i = pos + 1;
  while (i < input.size()) {
    char c = input[i];
    if (c == '\\') {
      i += 2;
    } else if (c == '`') {
      return i + 1;
    } else if (c == '$' && i + 1 < input.size() && input[i + 1] == '{') {
      i = FindSubstitutionEnd(input, i + 1);
      if (i == StringPiece::npos) {
        return StringPiece::npos;
      }
      ++i;
    } else {
      ++i;
    }
  }
  return StringPiece::npos;
}

RegionScanner::Result TemplateScanner::Scan(
    StringPiece input, size_t pos, const LexicalContext& context,
    size_t* end, RegionKind* kind) const {
  if (input[pos] != '`') {
    return kNoMatch;
  }
  size_t template_end = FindTemplateEnd(input, pos);
  if (template_end == StringPiece::npos) {
    return kUnterminated;
  }
  *end = template_end;
  *kind = kTemplateLiteral;
  return kMatched;
}

RegionScanner::Result RegexScanner::Scan(
    StringPiece input, size_t pos, const LexicalContext& context,
    size_t* end, RegionKind* kind) const {
  if (input[pos] != '/' || !context.RegexAllowed()) {
    return kNoMatch;
  }
  // Comments are not regexes.
  if (pos + 1 < input.size() &&
      (input[pos + 1] == '/' || input[pos + 1] == '*')) {
    return kNoMatch;
  }
  bool within_brackets = false;
  size_t i = pos + 1;
  while (i < input.size()) {
    const char c = input[i];
    ++i;
    if (c == '\\') {
      // The escaped character can be a '/' or ']', but not a line break.
      if (i < input.size() && (input[i] == '\n' || input[i] == '\r')) {
        return kUnterminated;
      }
      ++i;
    } else if (c == '/') {
      // Slashes within brackets are implicitly escaped.
      if (!within_brackets) {
        while (i < input.size() && IsWordChar(kJsLanguage, input[i])) {
          ++i;
        }
        *end = i;
        *kind = kRegexLiteral;
        return kMatched;
      }
    } else if (c == '[') {
      // Regex brackets don't nest, so a bool is enough.
      within_brackets = true;
    } else if (c == ']') {
      within_brackets = false;
    } else if (c == '\n' || c == '\r') {
      return kUnterminated;
    }
  }
  return kUnterminated;
}

}  // namespace js

}  // namespace assetspeed
