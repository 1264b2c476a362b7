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


#ifndef ASSETSPEED_KERNEL_JS_JS_MINIFY_H_
#define ASSETSPEED_KERNEL_JS_JS_MINIFY_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/minify/minify_rule_set.h"
#include "assetspeed/kernel/minify/minify_status.h"
#include "assetspeed/kernel/minify/region_extractor.h"

namespace assetspeed {

class MinifyOptions;
class RegionMap;

namespace js {

// Represents the kind of whitespace between two tokens:
//   kNoWhitespace means that there is no whitespace between the tokens.
//   kSpace means there's been at least one space/tab, but no linebreaks.
//   kLinebreak means there's been at least one linebreak.
enum JsWhitespace { kNoWhitespace, kSpace, kLinebreak };

// Javascript minification without a parser.  Strings, templates and regex
// literals are replaced by placeholders first, so the remaining stages
// only ever see names, numbers and punctuation; the regex/division
// ambiguity is settled once, during extraction, from the preceding token.
//
//   if (x == true) { return false; }   =>   if(x==!0){return!1}
class JsRuleSet : public MinifyRuleSet {
 public:
  // options must outlive the rule set.
  explicit JsRuleSet(const MinifyOptions* options);
  ~JsRuleSet() override;

  AssetLanguage language() const override { return kJsLanguage; }

  MinifyStatus ExtractRegions(StringPiece input, GoogleString* output,
                              RegionMap* regions) const override;
  // A removed block comment spanning a line break becomes a line break,
  // since it terminates the statement for semicolon insertion.
  MinifyStatus StripComments(StringPiece input,
                             GoogleString* output) const override;
  MinifyStatus Collapse(StringPiece input,
                        GoogleString* output) const override;
  MinifyStatus Rewrite(StringPiece input, const RegionMap& regions,
                       GoogleString* output) const override;

 private:
  const MinifyOptions* options_;
  RegionExtractor extractor_;

  DISALLOW_COPY_AND_ASSIGN(JsRuleSet);
};

}  // namespace js

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_JS_JS_MINIFY_H_
