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


#ifndef ASSETSPEED_KERNEL_MINIFY_MINIFY_RULE_SET_H_
#define ASSETSPEED_KERNEL_MINIFY_MINIFY_RULE_SET_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/minify/minify_status.h"

namespace assetspeed {

class RegionMap;

// The language-specific half of minification.  MinifyPipeline drives the
// stages in order and restores the regions itself.  Each stage appends
// to *output and leaves *output unspecified on error.
class MinifyRuleSet {
 public:
  MinifyRuleSet() {}
  virtual ~MinifyRuleSet();

  virtual AssetLanguage language() const = 0;

  virtual MinifyStatus ExtractRegions(StringPiece input, GoogleString* output,
                                      RegionMap* regions) const = 0;
  virtual MinifyStatus StripComments(StringPiece input,
                                     GoogleString* output) const = 0;
  virtual MinifyStatus Collapse(StringPiece input,
                                GoogleString* output) const = 0;
  // The regions are available so rewrites can look inside literals, for
  // example to turn x["name"] into x.name.
  virtual MinifyStatus Rewrite(StringPiece input, const RegionMap& regions,
                               GoogleString* output) const = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(MinifyRuleSet);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_MINIFY_MINIFY_RULE_SET_H_
