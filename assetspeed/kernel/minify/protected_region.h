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


#ifndef ASSETSPEED_KERNEL_MINIFY_PROTECTED_REGION_H_
#define ASSETSPEED_KERNEL_MINIFY_PROTECTED_REGION_H_

#include <cstddef>
#include <vector>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

enum RegionKind {
  kImportantComment,
  kStringLiteral,
  kRegexLiteral,
  kTemplateLiteral,
  kDataUri,
  kCalcExpr,
  kUrlReference
};

// The KIND part of a placeholder, e.g. "STRING" for kStringLiteral.
const char* RegionKindPlaceholderName(RegionKind kind);

struct ProtectedRegion {
  ProtectedRegion(const GoogleString& placeholder_in, StringPiece original_in,
                  RegionKind kind_in)
      : placeholder(placeholder_in),
        original_text(original_in),
        kind(kind_in) {
  }

  GoogleString placeholder;
  GoogleString original_text;
  RegionKind kind;
};

// Bookkeeping for one minification: the ordered placeholder -> original
// text mapping built by extraction and consumed by restoration.
//
// Placeholders look like ___STRING_3___.  They consist of identifier
// characters only, so the collapse and rewrite stages see each one as a
// single opaque word.  The number is the region's index in this map.
class RegionMap {
 public:
  RegionMap();
  ~RegionMap();

  // Records a region and returns its placeholder.
  const GoogleString& Add(RegionKind kind, StringPiece original_text);

  int size() const { return static_cast<int>(regions_.size()); }
  bool empty() const { return regions_.empty(); }
  const ProtectedRegion& region(int index) const { return regions_[index]; }
  void Clear() { regions_.clear(); }

  // Returns the region whose placeholder starts text, or NULL.  *length is
  // set to the placeholder's length on success.
  const ProtectedRegion* FindAtStart(StringPiece text, size_t* length) const;

  // Replaces every placeholder in text by its original text, in one pass.
  // Placeholder-like text that does not belong to this map is copied
  // unchanged.
  void Restore(StringPiece text, GoogleString* out) const;

  // Parses a placeholder at the start of text.  Returns its length, or 0
  // if text does not start with one.  Does not consult any map.
  static size_t ParsePlaceholder(StringPiece text, RegionKind* kind,
                                 int* index);

  // Whether text contains anything of placeholder form.  Such input can
  // not be minified safely, since restoration would rewrite it.
  static bool ContainsPlaceholderSyntax(StringPiece text);

 private:
  std::vector<ProtectedRegion> regions_;

  DISALLOW_COPY_AND_ASSIGN(RegionMap);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_MINIFY_PROTECTED_REGION_H_
