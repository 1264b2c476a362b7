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


#include "assetspeed/kernel/js/js_minify.h"

#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/minify/minify_options.h"
#include "assetspeed/kernel/minify/minify_status.h"
#include "assetspeed/kernel/minify/protected_region.h"

namespace assetspeed {

namespace js {

namespace {

class JsMinifyTest : public ::testing::Test {
 protected:
  JsMinifyTest() : rule_set_(&options_) {}

  MinifyStatus Minify(StringPiece input, GoogleString* output) {
    RegionMap regions;
    GoogleString extracted, stripped, collapsed, rewritten;
    MinifyStatus status =
        rule_set_.ExtractRegions(input, &extracted, &regions);
    if (status == kMinifyOk) {
      status = rule_set_.StripComments(extracted, &stripped);
    }
    if (status == kMinifyOk) {
      status = rule_set_.Collapse(stripped, &collapsed);
    }
    if (status == kMinifyOk) {
      status = rule_set_.Rewrite(collapsed, regions, &rewritten);
    }
    output->clear();
    if (status == kMinifyOk) {
      regions.Restore(rewritten, output);
    }
    return status;
  }

  void CheckMinification(StringPiece input, StringPiece expected) {
    GoogleString output;
    ASSERT_EQ(kMinifyOk, Minify(input, &output)) << input;
    EXPECT_STREQ(expected, output);
    GoogleString again;
    ASSERT_EQ(kMinifyOk, Minify(output, &again));
    EXPECT_STREQ(output, again) << "second pass changed the output";
  }

  void CheckUnchanged(StringPiece input) {
    CheckMinification(input, input);
  }

  void CheckFailure(StringPiece input, MinifyStatus expected) {
    GoogleString output;
    EXPECT_EQ(expected, Minify(input, &output)) << input;
  }

  MinifyOptions options_;
  JsRuleSet rule_set_;
};

TEST_F(JsMinifyTest, BooleansAndBraces) {
  CheckMinification("if (x == true) { return false; }",
                    "if(x==!0){return!1}");
}

TEST_F(JsMinifyTest, RegexAndDivision) {
  CheckMinification("var re = /a\\/b/; var y = 10 / 2;",
                    "var re=/a\\/b/;var y=10/2;");
  CheckUnchanged("return /abc/g.test(x)");
  CheckUnchanged("a/b/g");
}

TEST_F(JsMinifyTest, RegexContexts) {
  CheckMinification("x = a++ / 2", "x=a++/2");
  CheckMinification("x = (a) / 2 / b", "x=(a)/2/b");
  CheckMinification("if (/^a/.test(s)) {}", "if(/^a/.test(s)){}");
  CheckMinification("var r = /[/]/g, s = 1", "var r=/[/]/g,s=1");
  CheckMinification("x = `a` / 2", "x=`a`/2");
}

TEST_F(JsMinifyTest, DivisionBeforeRegexKeepsSpace) {
  CheckMinification("a = b / /re/.exec(c).length",
                    "a=b/ /re/.exec(c).length");
}

TEST_F(JsMinifyTest, EmptyInput) {
  CheckMinification("", "");
  CheckMinification(" \n\t\r\n ", "");
}

TEST_F(JsMinifyTest, StripComments) {
  GoogleString out;
  EXPECT_EQ(kMinifyOk, rule_set_.StripComments("a // c\nb", &out));
  EXPECT_STREQ("a \nb", out);
  out.clear();
  EXPECT_EQ(kMinifyOk, rule_set_.StripComments("a /* x\ny */ b", &out));
  EXPECT_STREQ("a \n b", out);
  out.clear();
  EXPECT_EQ(kMinifyOk, rule_set_.StripComments("a /* x */ b", &out));
  EXPECT_STREQ("a   b", out);
}

TEST_F(JsMinifyTest, Comments) {
  CheckMinification(
      "var a = 1; // comment\nvar b = 2; /* block */ var c = 3;",
      "var a=1;var b=2;var c=3;");
  CheckMinification("x = a /* c */ + b", "x=a+b");
  CheckMinification("a = 1 /* x\n y */ b = 2", "a=1\nb=2");
}

TEST_F(JsMinifyTest, ImportantComments) {
  CheckMinification("/*! License */\nvar a = 1;",
                    "/*! License */\nvar a=1;");
  CheckMinification("/*@cc_on x = 1; @*/", "/*@cc_on x = 1; @*/");
}

TEST_F(JsMinifyTest, LinebreaksKeptForSemicolonInsertion) {
  CheckMinification("a = b\nc = d", "a=b\nc=d");
  CheckMinification("i\n++\nj", "i\n++\nj");
}

TEST_F(JsMinifyTest, RestrictedProductions) {
  CheckMinification("function f() {\n  return\n  x;\n}",
                    "function f(){return;x}");
  CheckMinification("while (a) {\n  break\n  foo()\n}",
                    "while(a){break;foo()}");
}

TEST_F(JsMinifyTest, OperatorsNotJoined) {
  CheckMinification("a + +b", "a+ +b");
  CheckMinification("a - -b", "a- -b");
  CheckMinification("a++ + b", "a++ +b");
  CheckMinification("x < ! --y", "x< ! --y");
}

TEST_F(JsMinifyTest, WordsKeepOneSpace) {
  CheckMinification("var  x  =  typeof  y ;  var z = a  in  b",
                    "var x=typeof y;var z=a in b");
  CheckMinification("return  \"x\"", "return \"x\"");
}

TEST_F(JsMinifyTest, IntegerMemberAccess) {
  CheckUnchanged("1 .toString()");
  CheckUnchanged("1.5.toFixed()");
}

TEST_F(JsMinifyTest, Booleans) {
  CheckMinification("x = true; y = false", "x=!0;y=!1");
  CheckMinification("f(true)", "f(!0)");
  CheckMinification("x = y ? true : false", "x=y?!0:!1");
  CheckMinification("x == true && y", "x==!0&&y");
  CheckMinification("a + +true", "a+ +!0");
}

TEST_F(JsMinifyTest, BooleansKeptWhereNotLiterals) {
  CheckUnchanged("a.true;b={true:1,false:2};c=true.toString();true=1");
  CheckUnchanged("x=true**2;y=true[0];z=true?.x");
  CheckUnchanged("o={true(){}}");
}

TEST_F(JsMinifyTest, PrivateNamesKeepBooleans) {
  CheckUnchanged("class A{#true=1;m(){return this.#true}}");
  CheckMinification("class B{#false;n(){return this.#false&&true}}",
                    "class B{#false;n(){return this.#false&&!0}}");
  CheckMinification("class C{#x=true}", "class C{#x=!0}");
}

TEST_F(JsMinifyTest, BooleansDisabled) {
  options_.set_js_shorten_booleans(false);
  CheckMinification("x = true", "x=true");
}

TEST_F(JsMinifyTest, DotNotation) {
  CheckMinification("a[\"b\"] = c['d']", "a.b=c.d");
  CheckMinification("f()['x']", "f().x");
  CheckMinification("this['x'] = a[0]['y']", "this.x=a[0].y");
  CheckMinification("$['x_1']", "$.x_1");
}

TEST_F(JsMinifyTest, DotNotationNotApplicable) {
  CheckUnchanged("a[\"b-c\"];a['class'];a['let'];a[\"1x\"];[\"x\"].length;");
  CheckUnchanged("if(y)['a'].forEach(g)");
  CheckUnchanged("a['b']in c");
  CheckUnchanged("x['a\\'b']");
  CheckUnchanged("return['x']");
  CheckUnchanged("a?.['x']");
}

TEST_F(JsMinifyTest, DotNotationDisabled) {
  options_.set_js_dot_notation(false);
  CheckUnchanged("a['b']");
}

TEST_F(JsMinifyTest, Semicolons) {
  CheckMinification("a;;b;;", "a;b;");
  CheckMinification("{a();;}", "{a()}");
  CheckUnchanged("for(;;){x}");
  CheckMinification("for (;;) { x; }", "for(;;){x}");
}

TEST_F(JsMinifyTest, EmptyStatementsKept) {
  CheckUnchanged("if(a);else;");
  CheckUnchanged("function f(){while(x);}");
  CheckUnchanged("switch(x){case 1:;}");
  CheckUnchanged("do;while(x)");
}

TEST_F(JsMinifyTest, Templates) {
  CheckMinification("var s = `a ${ b + `c${d}` } e`;",
                    "var s=`a ${ b + `c${d}` } e`;");
  CheckMinification("x = `${\"}\"}`", "x=`${\"}\"}`");
  CheckMinification("x = `line1\n   line2`", "x=`line1\n   line2`");
}

TEST_F(JsMinifyTest, Strings) {
  CheckMinification("var s = 'a  /* not */  b' + \"// nope\";",
                    "var s='a  /* not */  b'+\"// nope\";");
}

TEST_F(JsMinifyTest, Malformed) {
  CheckFailure("var s = 'abc", kMalformedInput);
  CheckFailure("var r = /abc", kMalformedInput);
  CheckFailure("var r = /abc\n/", kMalformedInput);
  CheckFailure("var t = `abc", kMalformedInput);
  CheckFailure("var t = `${a`", kMalformedInput);
  CheckFailure("a = 1; /* open", kMalformedInput);
  CheckFailure("var s = 'a\nb'", kMalformedInput);
}

TEST_F(JsMinifyTest, PlaceholderConflict) {
  CheckFailure("var ___REGEX_0___ = 1", kPlaceholderConflict);
}

}  // namespace

}  // namespace js

}  // namespace assetspeed
