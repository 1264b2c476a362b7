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

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/mock_message_handler.h"
#include "assetspeed/kernel/base/null_mutex.h"
#include "assetspeed/kernel/base/scoped_ptr.h"
#include "assetspeed/kernel/base/statistics.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/thread_system.h"
#include "assetspeed/kernel/minify/asset_identity.h"
#include "assetspeed/kernel/minify/minify_options.h"
#include "assetspeed/kernel/minify/minify_rule_set.h"
#include "assetspeed/kernel/minify/protected_region.h"
#include "assetspeed/kernel/util/simple_stats.h"

namespace assetspeed {

namespace {

// Echoes its input through every stage, counting calls.  One stage can be
// made to fail.
class CountingRuleSet : public MinifyRuleSet {
 public:
  explicit CountingRuleSet(AssetLanguage language)
      : language_(language),
        failing_stage_(MinifyPipeline::kRestoreStage),
        extract_calls_(0),
        strip_calls_(0),
        collapse_calls_(0),
        rewrite_calls_(0) {
  }

  AssetLanguage language() const override { return language_; }

  MinifyStatus ExtractRegions(StringPiece input, GoogleString* output,
                              RegionMap* regions) const override {
    ++extract_calls_;
    return Echo(MinifyPipeline::kExtractStage, input, output);
  }
  MinifyStatus StripComments(StringPiece input,
                             GoogleString* output) const override {
    ++strip_calls_;
    return Echo(MinifyPipeline::kStripCommentsStage, input, output);
  }
  MinifyStatus Collapse(StringPiece input,
                        GoogleString* output) const override {
    ++collapse_calls_;
    return Echo(MinifyPipeline::kCollapseStage, input, output);
  }
  MinifyStatus Rewrite(StringPiece input, const RegionMap& regions,
                       GoogleString* output) const override {
    ++rewrite_calls_;
    return Echo(MinifyPipeline::kRewriteStage, input, output);
  }

  // The restore stage is run by the pipeline and can not fail.
  void set_failing_stage(MinifyPipeline::Stage stage) {
    failing_stage_ = stage;
  }

  int extract_calls() const { return extract_calls_; }
  int strip_calls() const { return strip_calls_; }
  int collapse_calls() const { return collapse_calls_; }
  int rewrite_calls() const { return rewrite_calls_; }
  int total_calls() const {
    return extract_calls_ + strip_calls_ + collapse_calls_ + rewrite_calls_;
  }

 private:
  MinifyStatus Echo(MinifyPipeline::Stage stage, StringPiece input,
                    GoogleString* output) const {
    if (stage == failing_stage_) {
      output->append("partial");
      return kMalformedInput;
    }
    output->append(input.data(), input.size());
    return kMinifyOk;
  }

  AssetLanguage language_;
  MinifyPipeline::Stage failing_stage_;
  mutable int extract_calls_;
  mutable int strip_calls_;
  mutable int collapse_calls_;
  mutable int rewrite_calls_;

  DISALLOW_COPY_AND_ASSIGN(CountingRuleSet);
};

class MinifyPipelineTest : public testing::Test {
 protected:
  MinifyPipelineTest()
      : thread_system_(ThreadSystem::CreateThreadSystem()),
        stats_(thread_system_.get()),
        handler_(new NullMutex) {
    MinifyPipeline::InitStats(&stats_);
    pipeline_.reset(new MinifyPipeline(&options_, &stats_, &handler_));
  }

  MinifyResult Minify(AssetLanguage language, StringPiece handle,
                      StringPiece text, StringPiece url) {
    MinifyRequest request(language, text, AssetIdentity(handle, "hash", 1));
    request.set_url(url);
    MinifyResult result;
    pipeline_->Minify(request, &result);
    return result;
  }

  MinifyResult MinifyCss(StringPiece text) {
    return Minify(kCssLanguage, "style", text, "");
  }

  MinifyResult MinifyJs(StringPiece text) {
    return Minify(kJsLanguage, "script", text, "");
  }

  // Installs a counting rule set for language and returns it.
  CountingRuleSet* InstallCountingRuleSet(AssetLanguage language) {
    CountingRuleSet* rule_set = new CountingRuleSet(language);
    pipeline_->set_rule_set_for_testing(language, rule_set);
    return rule_set;
  }

  int64 Stat(const char* name) {
    return stats_.GetVariable(name)->Get();
  }

  void ExpectFallback(const MinifyResult& result, StringPiece raw,
                      MinifyStatus status) {
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(status, result.status);
    EXPECT_STREQ(raw, result.output_text);
    EXPECT_EQ(0, result.bytes_saved);
  }

  scoped_ptr<ThreadSystem> thread_system_;
  SimpleStats stats_;
  MinifyOptions options_;
  MockMessageHandler handler_;
  scoped_ptr<MinifyPipeline> pipeline_;
};

TEST_F(MinifyPipelineTest, Css) {
  const char kCss[] = "  .a  {  color : red ;  margin:0px;  }";
  MinifyResult result = MinifyCss(kCss);
  EXPECT_TRUE(result.succeeded);
  EXPECT_EQ(kMinifyOk, result.status);
  EXPECT_STREQ(".a{color:red;margin:0}", result.output_text);
  EXPECT_EQ(static_cast<int64>(sizeof(kCss) - 1 - 22), result.bytes_saved);
  EXPECT_EQ(1, Stat(MinifyPipeline::kMinifySuccesses));
  EXPECT_EQ(result.bytes_saved, Stat(MinifyPipeline::kMinifyBytesSaved));
  EXPECT_EQ(0, Stat(MinifyPipeline::kMinifyFallbacks));
  EXPECT_EQ(0, handler_.TotalMessages());
}

TEST_F(MinifyPipelineTest, JsBooleans) {
  MinifyResult result = MinifyJs("if (x == true) { return false; }");
  EXPECT_TRUE(result.succeeded);
  EXPECT_STREQ("if(x==!0){return!1}", result.output_text);
  EXPECT_HAS_SUBSTR_NE("true", result.output_text);
  EXPECT_HAS_SUBSTR_NE("false", result.output_text);
}

TEST_F(MinifyPipelineTest, JsRegexAndDivision) {
  MinifyResult result = MinifyJs("var re = /a\\/b/; var y = 10 / 2;");
  EXPECT_TRUE(result.succeeded);
  EXPECT_STREQ("var re=/a\\/b/;var y=10/2;", result.output_text);
}

TEST_F(MinifyPipelineTest, Idempotent) {
  const char kJs[] =
      "/*! (c) */\nfunction f(a) {\n  // note\n  return a['b'] + \" x \";\n}";
  MinifyResult first = MinifyJs(kJs);
  ASSERT_TRUE(first.succeeded);
  MinifyResult second = MinifyJs(first.output_text);
  ASSERT_TRUE(second.succeeded);
  EXPECT_STREQ(first.output_text, second.output_text);
  EXPECT_EQ(0, second.bytes_saved);
}

TEST_F(MinifyPipelineTest, EmptyInput) {
  MinifyResult result = MinifyCss("");
  EXPECT_TRUE(result.succeeded);
  EXPECT_TRUE(result.output_text.empty());
  EXPECT_EQ(0, result.bytes_saved);
}

TEST_F(MinifyPipelineTest, UnchangedTextSavesNothing) {
  CountingRuleSet* rule_set = InstallCountingRuleSet(kCssLanguage);
  MinifyResult result = MinifyCss("a{}");
  EXPECT_TRUE(result.succeeded);
  EXPECT_EQ(4, rule_set->total_calls());
  EXPECT_EQ(0, result.bytes_saved);
  EXPECT_EQ(0, Stat(MinifyPipeline::kMinifyBytesSaved));
}

TEST_F(MinifyPipelineTest, SizeLimit) {
  CountingRuleSet* rule_set = InstallCountingRuleSet(kJsLanguage);
  options_.set_max_input_bytes(5);
  MinifyResult result = MinifyJs("a = 1");
  EXPECT_TRUE(result.succeeded);
  EXPECT_EQ(1, rule_set->extract_calls());

  result = MinifyJs("a = 12");
  ExpectFallback(result, "a = 12", kSizeLimitExceeded);
  // No stage runs for an oversized input.
  EXPECT_EQ(1, rule_set->extract_calls());
  EXPECT_EQ(4, rule_set->total_calls());
  EXPECT_EQ(1, Stat(MinifyPipeline::kMinifySizeLimitExceeded));
  EXPECT_EQ(1, Stat(MinifyPipeline::kMinifyFallbacks));
  EXPECT_EQ(1, Stat(MinifyPipeline::kMinifySuccesses));
  EXPECT_HAS_SUBSTR("Serving js asset script unminified: size limit exceeded",
                    handler_.buffer());
}

TEST_F(MinifyPipelineTest, Excluded) {
  CountingRuleSet* rule_set = InstallCountingRuleSet(kJsLanguage);
  options_.Exclude("jquery*");
  options_.Exclude("/vendor/");
  ExpectFallback(Minify(kJsLanguage, "jquery-core", "var a = 1;", ""),
                 "var a = 1;", kExcludedAsset);
  ExpectFallback(Minify(kJsLanguage, "app", "var a = 1;",
                        "http://x.com/vendor/app.js"),
                 "var a = 1;", kExcludedAsset);
  EXPECT_TRUE(Minify(kJsLanguage, "app", "var a = 1;",
                     "http://x.com/js/app.js").succeeded);
  EXPECT_EQ(2, Stat(MinifyPipeline::kMinifyExcluded));
  EXPECT_EQ(4, rule_set->total_calls());
}

TEST_F(MinifyPipelineTest, LanguageDisabled) {
  options_.set_minify_css(false);
  ExpectFallback(MinifyCss("a { color: red }"), "a { color: red }",
                 kLanguageDisabled);
  EXPECT_TRUE(MinifyJs("var a = 1;").succeeded);
  EXPECT_EQ(1, Stat(MinifyPipeline::kMinifyFallbacks));
}

TEST_F(MinifyPipelineTest, AlreadyMinified) {
  CountingRuleSet* rule_set = InstallCountingRuleSet(kJsLanguage);
  ExpectFallback(Minify(kJsLanguage, "lib.min.js", "a = 1", ""), "a = 1",
                 kAlreadyMinified);
  ExpectFallback(Minify(kJsLanguage, "lib", "a = 1",
                        "http://x.com/lib.MIN.JS?ver=2#top"),
                 "a = 1", kAlreadyMinified);
  EXPECT_EQ(0, rule_set->total_calls());
  // The suffix must match the language.
  EXPECT_TRUE(Minify(kJsLanguage, "lib.min.css", "a = 1", "").succeeded);
  // A suffix in the query does not count.
  EXPECT_TRUE(Minify(kJsLanguage, "lib", "a = 1",
                     "http://x.com/lib.js?f=a.min.js").succeeded);

  options_.set_skip_minified_assets(false);
  EXPECT_TRUE(Minify(kJsLanguage, "lib.min.js", "a = 1", "").succeeded);
}

TEST_F(MinifyPipelineTest, GuardOrder) {
  options_.set_max_input_bytes(3);
  options_.set_minify_js(false);
  options_.Exclude("big");
  EXPECT_EQ(kSizeLimitExceeded,
            Minify(kJsLanguage, "big", "a = 1", "").status);
  options_.set_max_input_bytes(100);
  EXPECT_EQ(kExcludedAsset, Minify(kJsLanguage, "big", "a = 1", "").status);
  EXPECT_EQ(kLanguageDisabled,
            Minify(kJsLanguage, "x.min.js", "a = 1", "").status);
}

TEST_F(MinifyPipelineTest, MalformedFailsOpen) {
  const char kBroken[] = "var s = 'unterminated;\nvar t = 1;";
  ExpectFallback(MinifyJs(kBroken), kBroken, kMalformedInput);
  EXPECT_EQ(1, Stat(MinifyPipeline::kMinifyMalformedInput));
  EXPECT_EQ(1, Stat(MinifyPipeline::kMinifyFallbacks));
  EXPECT_EQ(0, Stat(MinifyPipeline::kMinifySuccesses));
  EXPECT_HAS_SUBSTR("extract stage failed for js asset script",
                    handler_.buffer());
  EXPECT_HAS_SUBSTR("Serving js asset script unminified: malformed input",
                    handler_.buffer());
  EXPECT_EQ(0, handler_.SeriousMessages());

  ExpectFallback(MinifyCss("a { color: red } /* open"),
                 "a { color: red } /* open", kMalformedInput);
  EXPECT_EQ(2, Stat(MinifyPipeline::kMinifyMalformedInput));
}

TEST_F(MinifyPipelineTest, PlaceholderConflict) {
  const char kJs[] = "var ___STRING_0___ = 'a';";
  ExpectFallback(MinifyJs(kJs), kJs, kPlaceholderConflict);
  EXPECT_EQ(1, Stat(MinifyPipeline::kMinifyFallbacks));
  EXPECT_EQ(0, Stat(MinifyPipeline::kMinifyMalformedInput));
}

TEST_F(MinifyPipelineTest, FailureStopsLaterStages) {
  CountingRuleSet* rule_set = InstallCountingRuleSet(kCssLanguage);
  rule_set->set_failing_stage(MinifyPipeline::kCollapseStage);
  ExpectFallback(MinifyCss("a { }"), "a { }", kMalformedInput);
  EXPECT_EQ(1, rule_set->extract_calls());
  EXPECT_EQ(1, rule_set->strip_calls());
  EXPECT_EQ(1, rule_set->collapse_calls());
  EXPECT_EQ(0, rule_set->rewrite_calls());
  EXPECT_HAS_SUBSTR("collapse stage failed for css asset style",
                    handler_.buffer());
}

TEST_F(MinifyPipelineTest, RunStagesReportsFailedStage) {
  CountingRuleSet rule_set(kJsLanguage);
  rule_set.set_failing_stage(MinifyPipeline::kRewriteStage);
  GoogleString output;
  MinifyPipeline::Stage failed_stage = MinifyPipeline::kExtractStage;
  EXPECT_EQ(kMalformedInput,
            pipeline_->RunStages(rule_set, "x", &output, &failed_stage));
  EXPECT_EQ(MinifyPipeline::kRewriteStage, failed_stage);
  EXPECT_TRUE(output.empty());
}

TEST_F(MinifyPipelineTest, StageNames) {
  ASSERT_EQ(5, MinifyPipeline::kNumStages);
  EXPECT_EQ(MinifyPipeline::kExtractStage, MinifyPipeline::kStageOrder[0]);
  EXPECT_EQ(MinifyPipeline::kRestoreStage, MinifyPipeline::kStageOrder[4]);
  EXPECT_STREQ("extract", MinifyPipeline::StageName(
      MinifyPipeline::kExtractStage));
  EXPECT_STREQ("strip comments", MinifyPipeline::StageName(
      MinifyPipeline::kStripCommentsStage));
  EXPECT_STREQ("restore", MinifyPipeline::StageName(
      MinifyPipeline::kRestoreStage));
}

TEST_F(MinifyPipelineTest, DefaultRuleSets) {
  EXPECT_EQ(kCssLanguage, pipeline_->rule_set(kCssLanguage)->language());
  EXPECT_EQ(kJsLanguage, pipeline_->rule_set(kJsLanguage)->language());
}

}  // namespace

}  // namespace assetspeed
