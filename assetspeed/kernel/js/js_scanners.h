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


#ifndef ASSETSPEED_KERNEL_JS_JS_SCANNERS_H_
#define ASSETSPEED_KERNEL_JS_JS_SCANNERS_H_

#include <cstddef>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/minify/protected_region.h"
#include "assetspeed/kernel/minify/region_extractor.h"

namespace assetspeed {

namespace js {

// IE conditional compilation comments, /*@cc_on ... @*/.  Scripts rely on
// them, so they are kept verbatim like important comments.
class ConditionalCommentScanner : public RegionScanner {
 public:
  ConditionalCommentScanner() {}
  Result Scan(StringPiece input, size_t pos, const LexicalContext& context,
              size_t* end, RegionKind* kind) const override;

 private:
  DISALLOW_COPY_AND_ASSIGN(ConditionalCommentScanner);
};

// `...` template literals.  ${...} substitutions may contain strings,
// braces and further templates; the whole literal is one region.
class TemplateScanner : public RegionScanner {
 public:
  TemplateScanner() {}
  Result Scan(StringPiece input, size_t pos, const LexicalContext& context,
              size_t* end, RegionKind* kind) const override;

  // Returns the offset one past the backquote closing the template that
  // starts at input[pos], or npos.
  static size_t FindTemplateEnd(StringPiece input, size_t pos);

 private:
  DISALLOW_COPY_AND_ASSIGN(TemplateScanner);
};

// /.../flags regex literals.  Only consulted where the context allows an
// expression to start; elsewhere '/' is division.
class RegexScanner : public RegionScanner {
 public:
  RegexScanner() {}
  Result Scan(StringPiece input, size_t pos, const LexicalContext& context,
              size_t* end, RegionKind* kind) const override;

 private:
  DISALLOW_COPY_AND_ASSIGN(RegexScanner);
};

}  // namespace js

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_JS_JS_SCANNERS_H_
