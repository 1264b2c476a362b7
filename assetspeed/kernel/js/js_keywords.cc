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


#include "assetspeed/kernel/js/js_keywords.h"

#include <algorithm>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

namespace js {

namespace {

// Each table is kept sorted for binary search.
const char* const kReservedWords[] = {
  "abstract", "await", "boolean", "break", "byte", "case", "catch", "char",
  "class", "const", "continue", "debugger", "default", "delete", "do",
  "double", "else", "enum", "export", "extends", "false", "final",
  "finally", "float", "for", "function", "goto", "if", "implements",
  "import", "in", "instanceof", "int", "interface", "long", "native",
  "new", "null", "package", "private", "protected", "public", "return",
  "short", "static", "super", "switch", "synchronized", "this", "throw",
  "throws", "transient", "true", "try", "typeof", "var", "void",
  "volatile", "while", "with", "yield"
};

const char* const kContextualKeywords[] = {
  "async", "await", "get", "let", "of", "set", "static", "yield"
};

const char* const kRegexPrecedingKeywords[] = {
  "await", "case", "delete", "do", "else", "in", "instanceof", "new",
  "return", "throw", "typeof", "void", "yield"
};

const char* const kRestrictedProductions[] = {
  "break", "continue", "return", "throw", "yield"
};

const char* const kControlHeaderKeywords[] = {
  "catch", "for", "if", "switch", "while", "with"
};

struct KeywordLess {
  bool operator()(const char* a, StringPiece b) const {
    return StringPiece(a) < b;
  }
  bool operator()(StringPiece a, const char* b) const {
    return a < StringPiece(b);
  }
};

template<size_t N>
bool InTable(const char* const (&table)[N], StringPiece name) {
  return std::binary_search(table, table + N, name, KeywordLess());
}

}  // namespace

bool JsKeywords::IsReservedWord(StringPiece name) {
  return InTable(kReservedWords, name);
}

bool JsKeywords::IsContextualKeyword(StringPiece name) {
  return InTable(kContextualKeywords, name);
}

bool JsKeywords::CanKeywordPrecedeRegEx(StringPiece name) {
  return InTable(kRegexPrecedingKeywords, name);
}

bool JsKeywords::IsRestrictedProduction(StringPiece name) {
  return InTable(kRestrictedProductions, name);
}

bool JsKeywords::StartsControlHeader(StringPiece name) {
  return InTable(kControlHeaderKeywords, name);
}

}  // namespace js

}  // namespace assetspeed
