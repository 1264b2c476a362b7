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


#include "assetspeed/kernel/minify/minify_pipeline.h"

#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/statistics.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/css/css_minify.h"
#include "assetspeed/kernel/js/js_minify.h"
#include "assetspeed/kernel/minify/minify_options.h"
#include "assetspeed/kernel/minify/minify_rule_set.h"
#include "assetspeed/kernel/minify/protected_region.h"

namespace assetspeed {

const MinifyPipeline::Stage MinifyPipeline::kStageOrder[] = {
  kExtractStage,
  kStripCommentsStage,
  kCollapseStage,
  kRewriteStage,
  kRestoreStage
};
const int MinifyPipeline::kNumStages = arraysize(kStageOrder);

const char MinifyPipeline::kMinifySuccesses[] = "minify_successes";
const char MinifyPipeline::kMinifyFallbacks[] = "minify_fallbacks";
const char MinifyPipeline::kMinifyBytesSaved[] = "minify_bytes_saved";
const char MinifyPipeline::kMinifyMalformedInput[] = "minify_malformed_input";
const char MinifyPipeline::kMinifySizeLimitExceeded[] =
    "minify_size_limit_exceeded";
const char MinifyPipeline::kMinifyExcluded[] = "minify_excluded";

namespace {

// The name without any query or fragment.
StringPiece UrlPath(StringPiece url) {
  size_t end = url.find_first_of("?#");
  return (end == StringPiece::npos) ? url : url.substr(0, end);
}

bool HasMinifiedSuffix(StringPiece name, AssetLanguage language) {
  return StringCaseEndsWith(
      name, (language == kCssLanguage) ? ".min.css" : ".min.js");
}

}  // namespace

MinifyPipeline::MinifyPipeline(const MinifyOptions* options,
                               Statistics* statistics,
                               MessageHandler* handler)
    : options_(options),
      handler_(handler),
      css_rule_set_(new css::CssRuleSet(options)),
      js_rule_set_(new js::JsRuleSet(options)) {
  successes_ = statistics->GetVariable(kMinifySuccesses);
  fallbacks_ = statistics->GetVariable(kMinifyFallbacks);
  bytes_saved_ = statistics->GetVariable(kMinifyBytesSaved);
  malformed_input_ = statistics->GetVariable(kMinifyMalformedInput);
  size_limit_exceeded_ = statistics->GetVariable(kMinifySizeLimitExceeded);
  excluded_ = statistics->GetVariable(kMinifyExcluded);
}

MinifyPipeline::~MinifyPipeline() {
}

void MinifyPipeline::InitStats(Statistics* statistics) {
  statistics->AddVariable(kMinifySuccesses);
  statistics->AddVariable(kMinifyFallbacks);
  statistics->AddVariable(kMinifyBytesSaved);
  statistics->AddVariable(kMinifyMalformedInput);
  statistics->AddVariable(kMinifySizeLimitExceeded);
  statistics->AddVariable(kMinifyExcluded);
}

const char* MinifyPipeline::StageName(Stage stage) {
  switch (stage) {
    case kExtractStage:
      return "extract";
    case kStripCommentsStage:
      return "strip comments";
    case kCollapseStage:
      return "collapse";
    case kRewriteStage:
      return "rewrite";
    case kRestoreStage:
      return "restore";
  }
  return "unknown";
}

const MinifyRuleSet* MinifyPipeline::rule_set(AssetLanguage language) const {
  return (language == kCssLanguage) ? css_rule_set_.get()
                                    : js_rule_set_.get();
}

void MinifyPipeline::set_rule_set_for_testing(AssetLanguage language,
                                              MinifyRuleSet* rule_set) {
  if (language == kCssLanguage) {
    css_rule_set_.reset(rule_set);
  } else {
    js_rule_set_.reset(rule_set);
  }
}

MinifyStatus MinifyPipeline::CheckGuards(const MinifyRequest& request) const {
  const GoogleString& handle = request.identity().handle();
  const AssetLanguage language = request.language();
  if (static_cast<int64>(request.raw_text().size()) >
      options_->max_input_bytes()) {
    return kSizeLimitExceeded;
  }
  if (options_->IsExcluded(handle, request.url())) {
    return kExcludedAsset;
  }
  if (!((language == kCssLanguage) ? options_->minify_css()
                                   : options_->minify_js())) {
    return kLanguageDisabled;
  }
  if (options_->skip_minified_assets() &&
      (HasMinifiedSuffix(handle, language) ||
       HasMinifiedSuffix(UrlPath(request.url()), language))) {
    return kAlreadyMinified;
  }
  return kMinifyOk;
}

MinifyStatus MinifyPipeline::RunStage(Stage stage, const MinifyRuleSet& rules,
                                      StringPiece input, RegionMap* regions,
                                      GoogleString* output) const {
  switch (stage) {
    case kExtractStage:
      return rules.ExtractRegions(input, output, regions);
    case kStripCommentsStage:
      return rules.StripComments(input, output);
    case kCollapseStage:
      return rules.Collapse(input, output);
    case kRewriteStage:
      return rules.Rewrite(input, *regions, output);
    case kRestoreStage:
      regions->Restore(input, output);
      return kMinifyOk;
  }
  return kMalformedInput;
}

MinifyStatus MinifyPipeline::RunStages(const MinifyRuleSet& rules,
                                       StringPiece input,
                                       GoogleString* output,
                                       Stage* failed_stage) const {
  // All bookkeeping for this run lives here, so concurrent runs share
  // nothing.
  RegionMap regions;
  GoogleString current(input);
  for (int i = 0; i < kNumStages; ++i) {
    GoogleString next;
    MinifyStatus status =
        RunStage(kStageOrder[i], rules, current, &regions, &next);
    if (status != kMinifyOk) {
      *failed_stage = kStageOrder[i];
      return status;
    }
    current.swap(next);
  }
  output->swap(current);
  return kMinifyOk;
}

void MinifyPipeline::Minify(const MinifyRequest& request,
                            MinifyResult* result) const {
  MinifyStatus status = CheckGuards(request);
  GoogleString output;
  if (status == kMinifyOk) {
    Stage failed_stage = kExtractStage;
    status = RunStages(*rule_set(request.language()), request.raw_text(),
                       &output, &failed_stage);
    if (status != kMinifyOk) {
      handler_->Message(kInfo, "%s stage failed for %s asset %s",
                        StageName(failed_stage),
                        AssetLanguageName(request.language()),
                        request.identity().handle().c_str());
    }
  }
  if (status != kMinifyOk) {
    Fallback(request, status, result);
    return;
  }
  result->bytes_saved = static_cast<int64>(request.raw_text().size()) -
      static_cast<int64>(output.size());
  result->output_text.swap(output);
  result->succeeded = true;
  result->status = kMinifyOk;
  successes_->Add(1);
  if (result->bytes_saved > 0) {
    bytes_saved_->Add(result->bytes_saved);
  }
}

void MinifyPipeline::Fallback(const MinifyRequest& request,
                              MinifyStatus status,
                              MinifyResult* result) const {
  result->output_text = request.raw_text();
  result->bytes_saved = 0;
  result->succeeded = false;
  result->status = status;
  fallbacks_->Add(1);
  switch (status) {
    case kMalformedInput:
      malformed_input_->Add(1);
      break;
    case kSizeLimitExceeded:
      size_limit_exceeded_->Add(1);
      break;
    case kExcludedAsset:
      excluded_->Add(1);
      break;
    default:
      break;
  }
  handler_->Message(kInfo, "Serving %s asset %s unminified: %s",
                    AssetLanguageName(request.language()),
                    request.identity().handle().c_str(),
                    MinifyStatusName(status));
}

}  // namespace assetspeed
