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


#ifndef ASSETSPEED_KERNEL_UTIL_RE2_H_
#define ASSETSPEED_KERNEL_UTIL_RE2_H_

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

#include "re2/re2.h"

using re2::RE2;

typedef re2::StringPiece Re2StringPiece;

// Converts a StringPiece into an RE2 StringPiece.  Depending on the RE2
// release these may or may not be the same type, so always convert
// explicitly at the boundary.
inline re2::StringPiece StringPieceToRe2(StringPiece sp) {
  return re2::StringPiece(sp.data(), sp.size());
}

inline StringPiece Re2ToStringPiece(re2::StringPiece sp) {
  return StringPiece(sp.data(), sp.size());
}

#endif  // ASSETSPEED_KERNEL_UTIL_RE2_H_
