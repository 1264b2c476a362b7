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


#ifndef ASSETSPEED_KERNEL_MINIFY_MINIFY_PIPELINE_H_
#define ASSETSPEED_KERNEL_MINIFY_MINIFY_PIPELINE_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/scoped_ptr.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/minify/asset_identity.h"
#include "assetspeed/kernel/minify/minify_status.h"

namespace assetspeed {

class MessageHandler;
class MinifyOptions;
class MinifyRuleSet;
class RegionMap;
class Statistics;
class Variable;

// One asset to minify.
class MinifyRequest {
 public:
  MinifyRequest(AssetLanguage language, StringPiece raw_text,
                const AssetIdentity& identity)
      : language_(language),
        raw_text_(raw_text),
        identity_(identity) {
  }

  AssetLanguage language() const { return language_; }
  const GoogleString& raw_text() const { return raw_text_; }
  const AssetIdentity& identity() const { return identity_; }

  // The url the asset is served from, if known.  Only consulted by the
  // exclusion list and the already-minified check.
  const GoogleString& url() const { return url_; }
  void set_url(StringPiece url) { url_.assign(url.data(), url.size()); }

 private:
  AssetLanguage language_;
  GoogleString raw_text_;
  AssetIdentity identity_;
  GoogleString url_;

  DISALLOW_COPY_AND_ASSIGN(MinifyRequest);
};

struct MinifyResult {
  MinifyResult() : bytes_saved(0), succeeded(false), status(kMinifyOk) {}

  // Equal to the raw text when succeeded is false.
  GoogleString output_text;
  // Negative when minification grew the text.
  int64 bytes_saved;
  bool succeeded;
  // Why minification fell back; kMinifyOk when it succeeded.
  MinifyStatus status;
};

// Drives a rule set through
//   Extract -> StripComments -> Collapse -> Rewrite -> Restore
// and turns every failure into a fallback to the raw text.  A pipeline
// holds no per-request state and may be shared between threads.
class MinifyPipeline {
 public:
  enum Stage {
    kExtractStage,
    kStripCommentsStage,
    kCollapseStage,
    kRewriteStage,
    kRestoreStage
  };

  // The stages, in the order they run.
  static const Stage kStageOrder[];
  static const int kNumStages;

  // Statistics variable names.
  static const char kMinifySuccesses[];
  static const char kMinifyFallbacks[];
  static const char kMinifyBytesSaved[];
  static const char kMinifyMalformedInput[];
  static const char kMinifySizeLimitExceeded[];
  static const char kMinifyExcluded[];

  // options, statistics and handler must outlive the pipeline.
  MinifyPipeline(const MinifyOptions* options, Statistics* statistics,
                 MessageHandler* handler);
  ~MinifyPipeline();

  static void InitStats(Statistics* statistics);

  // Minifies request into *result.  Never fails: on any error *result
  // holds the raw text with succeeded false.
  void Minify(const MinifyRequest& request, MinifyResult* result) const;

  // The checks made before any stage runs: size, exclusion, disabled
  // language, already-minified name.  kMinifyOk if all pass.
  MinifyStatus CheckGuards(const MinifyRequest& request) const;

  // Runs every stage of rules over input.  On error, *failed_stage names
  // the stage that reported it.
  MinifyStatus RunStages(const MinifyRuleSet& rules, StringPiece input,
                         GoogleString* output, Stage* failed_stage) const;

  const MinifyRuleSet* rule_set(AssetLanguage language) const;

  // Replaces the rule set for a language.  Takes ownership.
  void set_rule_set_for_testing(AssetLanguage language,
                                MinifyRuleSet* rule_set);

  static const char* StageName(Stage stage);

 private:
  MinifyStatus RunStage(Stage stage, const MinifyRuleSet& rules,
                        StringPiece input, RegionMap* regions,
                        GoogleString* output) const;
  void Fallback(const MinifyRequest& request, MinifyStatus status,
                MinifyResult* result) const;

  const MinifyOptions* options_;
  MessageHandler* handler_;
  scoped_ptr<MinifyRuleSet> css_rule_set_;
  scoped_ptr<MinifyRuleSet> js_rule_set_;

  Variable* successes_;
  Variable* fallbacks_;
  Variable* bytes_saved_;
  Variable* malformed_input_;
  Variable* size_limit_exceeded_;
  Variable* excluded_;

  DISALLOW_COPY_AND_ASSIGN(MinifyPipeline);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_MINIFY_MINIFY_PIPELINE_H_
