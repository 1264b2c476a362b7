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


#ifndef ASSETSPEED_KERNEL_CSS_CSS_SCANNERS_H_
#define ASSETSPEED_KERNEL_CSS_CSS_SCANNERS_H_

#include <cstddef>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/minify/protected_region.h"
#include "assetspeed/kernel/minify/region_extractor.h"

namespace assetspeed {

namespace css {

// url(...) references, quoted or not.  A payload starting with "data:"
// is recorded as kDataUri, anything else as kUrlReference, so that
// numeric-looking path segments are never rewritten.
class UrlScanner : public RegionScanner {
 public:
  UrlScanner() {}
  Result Scan(StringPiece input, size_t pos, const LexicalContext& context,
              size_t* end, RegionKind* kind) const override;

 private:
  DISALLOW_COPY_AND_ASSIGN(UrlScanner);
};

// calc() and the other math functions whose '+' and '-' need surrounding
// whitespace: -webkit-calc(), -moz-calc(), clamp(), min() and max().
class CalcScanner : public RegionScanner {
 public:
  CalcScanner() {}
  Result Scan(StringPiece input, size_t pos, const LexicalContext& context,
              size_t* end, RegionKind* kind) const override;

  // Collapses whitespace runs to one space and drops whitespace after '('
  // and before ')'.  Quoted text is kept verbatim.
  GoogleString ProtectedText(StringPiece matched,
                             RegionKind kind) const override;

 private:
  DISALLOW_COPY_AND_ASSIGN(CalcScanner);
};

}  // namespace css

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_CSS_CSS_SCANNERS_H_
