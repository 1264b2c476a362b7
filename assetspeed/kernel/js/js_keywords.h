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


#ifndef ASSETSPEED_KERNEL_JS_JS_KEYWORDS_H_
#define ASSETSPEED_KERNEL_JS_JS_KEYWORDS_H_

#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

namespace js {

class JsKeywords {
 public:
  // Reserved words of every edition, including the literals true, false
  // and null and the future reserved words of ES3 (int, goto, ...).
  static bool IsReservedWord(StringPiece name);

  // Words that are identifiers in some positions and keywords in others:
  // of let yield await async get set static.
  static bool IsContextualKeyword(StringPiece name);

  // Whether name can not be written as a property after '.' without
  // risk in any engine.
  static bool IsKeyword(StringPiece name) {
    return IsReservedWord(name) || IsContextualKeyword(name);
  }

  // Keywords after which an expression, and so a regex literal, may start.
  static bool CanKeywordPrecedeRegEx(StringPiece name);

  // return, throw, break, continue and yield.  A line break directly after
  // one of these ends the statement.
  static bool IsRestrictedProduction(StringPiece name);

  // Keywords whose parenthesized clause is followed by a statement:
  // if for while with switch catch.
  static bool StartsControlHeader(StringPiece name);

 private:
  JsKeywords();
};

}  // namespace js

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_JS_JS_KEYWORDS_H_
