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


#ifndef ASSETSPEED_KERNEL_CSS_CSS_MINIFY_H_
#define ASSETSPEED_KERNEL_CSS_CSS_MINIFY_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/minify/minify_rule_set.h"
#include "assetspeed/kernel/minify/minify_status.h"
#include "assetspeed/kernel/minify/region_extractor.h"

namespace assetspeed {

class MinifyOptions;
class RegionMap;

namespace css {

// Text-level CSS minification.  No stylesheet is parsed: selectors and
// declarations are told apart by which of '{', ';' or '}' comes next, and
// url(), calc() and strings are hidden behind placeholders while the
// other stages run.
//
//   .a  {  color : red ;  margin:0px;  }   =>   .a{color:red;margin:0}
class CssRuleSet : public MinifyRuleSet {
 public:
  // options must outlive the rule set.
  explicit CssRuleSet(const MinifyOptions* options);
  ~CssRuleSet() override;

  AssetLanguage language() const override { return kCssLanguage; }

  MinifyStatus ExtractRegions(StringPiece input, GoogleString* output,
                              RegionMap* regions) const override;
  // Removes /* ... */ comments.  A comment between two identifier
  // characters becomes a space so the identifiers stay apart.
  MinifyStatus StripComments(StringPiece input,
                             GoogleString* output) const override;
  MinifyStatus Collapse(StringPiece input,
                        GoogleString* output) const override;
  // Shortens numbers and colors inside declaration values.  Selectors,
  // at-rule preludes, custom properties and declarations using progid:
  // filters are copied unchanged.
  MinifyStatus Rewrite(StringPiece input, const RegionMap& regions,
                       GoogleString* output) const override;

 private:
  void RewriteValue(StringPiece value, GoogleString* output) const;
  // Rewrites the number starting at value[pos], appending it and any unit
  // to output.  Returns the offset just past what was consumed.
  size_t RewriteNumber(StringPiece value, size_t pos, bool negative,
                       GoogleString* output) const;

  const MinifyOptions* options_;
  RegionExtractor extractor_;

  DISALLOW_COPY_AND_ASSIGN(CssRuleSet);
};

}  // namespace css

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_CSS_CSS_MINIFY_H_
