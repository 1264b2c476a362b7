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


#include "assetspeed/kernel/minify/region_extractor.h"

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

namespace {

// Keywords after which an expression, and so a regex literal, may start.
const char* const kRegexPrecedingKeywords[] = {
  "await", "case", "delete", "do", "else", "in", "instanceof", "new",
  "return", "throw", "typeof", "void", "yield"
};

}  // namespace

bool LexicalContext::RegexAllowed() const {
  switch (type_) {
    case kStartOfInput:
      return true;
    case kPunct:
      return (punct_ != ')') && (punct_ != ']');
    case kWord:
      for (size_t i = 0; i < arraysize(kRegexPrecedingKeywords); ++i) {
        if (word_ == kRegexPrecedingKeywords[i]) {
          return true;
        }
      }
      return false;
    case kIncrement:
    case kOperand:
      return false;
  }
  return false;
}

RegionScanner::~RegionScanner() {
}

GoogleString RegionScanner::ProtectedText(StringPiece matched,
                                          RegionKind kind) const {
  return GoogleString(matched);
}

RegionScanner::Result ImportantCommentScanner::Scan(
    StringPiece input, size_t pos, const LexicalContext& context,
    size_t* end, RegionKind* kind) const {
  if (!HasPrefixString(input.substr(pos), "/*!")) {
    return kNoMatch;
  }
  size_t close = input.find("*/", pos + 3);
  if (close == StringPiece::npos) {
    return kUnterminated;
  }
  *end = close + 2;
  *kind = kImportantComment;
  return kMatched;
}

size_t QuotedStringScanner::FindStringEnd(StringPiece input, size_t pos) {
  const char quote = input[pos];
  for (size_t i = pos + 1; i < input.size(); ++i) {
    char c = input[i];
    if (c == '\\') {
      // The escaped character, which may be a line break, is skipped.
      // "\\\r\n" continues the line as a unit.
      if (i + 2 < input.size() && input[i + 1] == '\r' &&
          input[i + 2] == '\n') {
        i += 2;
      } else {
        ++i;
      }
    } else if (c == quote) {
      return i + 1;
    } else if ((c == '\n') || (c == '\r')) {
      return StringPiece::npos;
    }
  }
  return StringPiece::npos;
}

RegionScanner::Result QuotedStringScanner::Scan(
    StringPiece input, size_t pos, const LexicalContext& context,
    size_t* end, RegionKind* kind) const {
  char c = input[pos];
  if ((c != '"') && (c != '\'')) {
    return kNoMatch;
  }
  size_t string_end = FindStringEnd(input, pos);
  if (string_end == StringPiece::npos) {
    return kUnterminated;
  }
  *end = string_end;
  *kind = kStringLiteral;
  return kMatched;
}

RegionExtractor::RegionExtractor(AssetLanguage language)
    : language_(language) {
}

RegionExtractor::~RegionExtractor() {
  for (int i = 0, n = scanners_.size(); i < n; ++i) {
    delete scanners_[i];
  }
}

void RegionExtractor::AddScanner(RegionScanner* scanner) {
  scanners_.push_back(scanner);
}

MinifyStatus RegionExtractor::Extract(StringPiece input, GoogleString* output,
                                      RegionMap* regions) const {
  if (RegionMap::ContainsPlaceholderSyntax(input)) {
    return kPlaceholderConflict;
  }
  output->reserve(output->size() + input.size());
  LexicalContext context;
  const size_t size = input.size();
  size_t pos = 0;
  while (pos < size) {
    const char c = input[pos];
    if (IsHtmlSpace(c)) {
      output->push_back(c);
      ++pos;
      continue;
    }

    // Scanners are only consulted where a token can begin; words are
    // consumed whole below.
    bool matched = false;
    for (int i = 0, n = scanners_.size(); (i < n) && !matched; ++i) {
      size_t end = pos;
      RegionKind kind = kStringLiteral;
      RegionScanner::Result result =
          scanners_[i]->Scan(input, pos, context, &end, &kind);
      if (result == RegionScanner::kUnterminated) {
        return kMalformedInput;
      } else if (result == RegionScanner::kMatched) {
        StringPiece text = input.substr(pos, end - pos);
        output->append(regions->Add(kind,
                                    scanners_[i]->ProtectedText(text, kind)));
        if (kind != kImportantComment) {
          context.SetOperand();
        }
        pos = end;
        matched = true;
      }
    }
    if (matched) {
      continue;
    }

    const char next = (pos + 1 < size) ? input[pos + 1] : '\0';
    if ((c == '/') && (next == '*')) {
      size_t close = input.find("*/", pos + 2);
      if (close == StringPiece::npos) {
        return kMalformedInput;
      }
      output->append(input.data() + pos, close + 2 - pos);
      pos = close + 2;
    } else if ((language_ == kJsLanguage) && (c == '/') && (next == '/')) {
      size_t eol = input.find_first_of("\r\n", pos);
      if (eol == StringPiece::npos) {
        eol = size;
      }
      output->append(input.data() + pos, eol - pos);
      pos = eol;
    } else if (IsWordChar(language_, c)) {
      size_t end = pos + 1;
      while ((end < size) && IsWordChar(language_, input[end])) {
        ++end;
      }
      StringPiece word = input.substr(pos, end - pos);
      output->append(word.data(), word.size());
      context.SetWord(word);
      pos = end;
    } else if ((language_ == kJsLanguage) && ((c == '+') || (c == '-')) &&
               (next == c)) {
      output->append(input.data() + pos, 2);
      context.SetIncrement();
      pos += 2;
    } else {
      output->push_back(c);
      context.SetPunct(c);
      ++pos;
    }
  }
  return kMinifyOk;
}

}  // namespace assetspeed
