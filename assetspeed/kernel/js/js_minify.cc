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

#include <vector>

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/js/js_keywords.h"
#include "assetspeed/kernel/js/js_scanners.h"
#include "assetspeed/kernel/minify/minify_options.h"
#include "assetspeed/kernel/minify/protected_region.h"
#include "assetspeed/kernel/util/re2.h"

namespace assetspeed {

namespace js {

namespace {

// Javascript's grammar has the appalling property that it cannot be lexed
// without also being parsed, due to its semicolon insertion rules and the
// ambiguity between regex literals and the division operator.  We don't want
// to build a full parser just for the sake of removing whitespace, so this
// code uses some heuristics to try to guess the relevant parsing details.

// A token can either be a character (0-255) or one of these constants:
const int kStartToken = 256;  // the start of the input
const int kCommentToken = 257;  // a kept comment placeholder
const int kRegexToken = 258;  // a regex literal placeholder
const int kStringToken = 259;  // a string or template placeholder
// We have to differentiate between the keywords that can precede a regex
// (such as throw) and those that can't to ensure that we don't treat return or
// throw as a primary expression (which could mess up linebreak removal).
const int kNameNumberToken = 260;  // name, number, keyword
const int kKeywordCanPrecedeRegExToken = 261;
// The ++ and -- tokens affect the semicolon insertion rules in Javascript, so
// we need to track them carefully in order to get whitespace removal right.
// Other multicharacter operators (such as += or ===) can just be treated as
// multiple single character operators, and it'll all come out okay.
const int kPlusPlusToken = 262;  // a ++ token
const int kMinusMinusToken = 263;  // a -- token

// Is this a character that can appear in identifiers?  Backslashes can
// appear in identifiers due to unicode escape sequences (e.g. \u03c0).
bool IsIdentifierChar(char c) {
  return IsWordChar(kJsLanguage, c) || (c == '\\');
}

// Returns the length of the name, number, keyword or placeholder at
// text[pos].  A placeholder at the start of a word is a token by itself.
size_t WordLength(StringPiece text, size_t pos) {
  RegionKind kind;
  int index;
  size_t length = RegionMap::ParsePlaceholder(text.substr(pos), &kind,
                                              &index);
  if (length != 0) {
    return length;
  }
  size_t end = pos;
  while (end < text.size() && IsIdentifierChar(text[end])) {
    ++end;
  }
  return end - pos;
}

bool IsDecimalInteger(StringPiece word) {
  for (size_t i = 0; i < word.size(); ++i) {
    if (!IsDecimalDigit(word[i])) {
      return false;
    }
  }
  return !word.empty();
}

// Return true if the given token cannot ever be the first or last token of a
// statement; that is, a semicolon will never be inserted next to this token.
// This function is used to help us with linebreak suppression.
bool CannotBeginOrEndStatement(int token) {
  switch (token) {
    case kStartToken:
    case '=':
    case '<':
    case '>':
    case ';':
    case ':':
    case '?':
    case '|':
    case '^':
    case '&':
    case '*':
    case '/':
    case '%':
    case ',':
    case '.':
      return true;
    default:
      return false;
  }
}

// Return true if the given token signifies that we are at the end of a primary
// expression (e.g. 42, or foo[0], or func()).
bool EndsPrimaryExpression(int token) {
  switch (token) {
    case kNameNumberToken:
    case kRegexToken:
    case kStringToken:
    case ')':
    case ']':
      return true;
    default:
      return false;
  }
}

// Tokens written as words: two of them in a row need a space between.
bool IsWordToken(int token) {
  switch (token) {
    case kNameNumberToken:
    case kKeywordCanPrecedeRegExToken:
    case kRegexToken:
    case kStringToken:
    case kCommentToken:
      return true;
    default:
      return false;
  }
}

// Return true if we can safely remove a linebreak from between the given two
// tokens (that is, if we're sure that the linebreak will not result in
// semicolon insertion), or false if we're not sure we can remove it safely.
bool CanSuppressLinebreak(int prev_token, int next_token) {
  // We can suppress the linebreak if the previous token can't possibly be
  // the end of a statement.
  if (CannotBeginOrEndStatement(prev_token) ||
      prev_token == '(' || prev_token == '[' || prev_token == '{' ||
      prev_token == '!' || prev_token == '~' ||
      prev_token == '+' || prev_token == '-') {
    return true;
  }
  // We can suppress the linebreak if the next token can't possibly be the
  // beginning of a statement.
  if (CannotBeginOrEndStatement(next_token) ||
      next_token == ')' || next_token == ']' ||
      next_token == '}') {
    return true;
  }
  // We can suppress the linebreak if one-token lookahead tells us that we
  // could keep parsing without inserting a semicolon.
  if (EndsPrimaryExpression(prev_token) &&
      (next_token == '(' || next_token == '[' ||
       next_token == '+' || next_token == '-')) {
    return true;
  }
  // Otherwise, we should leave the linebreak there, to be safe.
  return false;
}

// Removes whitespace between tokens, keeping a linebreak wherever it may
// be needed for semicolon insertion.
class Collapser {
 public:
  Collapser(StringPiece input, GoogleString* output)
      : input_(input),
        index_(0),
        output_(output),
        whitespace_(kNoWhitespace),
        prev_token_(kStartToken),
        prev_restricted_(false),
        prev_integer_(false) {
  }

  void Collapse();

 private:
  int Peek() const;
  void ChangeToken(int next_token);
  void InsertSpaceIfNeeded();
  void EmitLinebreak();
  void ConsumeWord();

  const StringPiece input_;
  size_t index_;
  GoogleString* output_;
  JsWhitespace whitespace_;  // whitespace since the previous token
  int prev_token_;
  // The previous token is return, throw, break, continue or yield.
  bool prev_restricted_;
  // The previous token is an integer literal, so a '.' after it would
  // be read as a decimal point.
  bool prev_integer_;

  DISALLOW_COPY_AND_ASSIGN(Collapser);
};

// Return the next character after index_, or -1 if there aren't any more.
int Collapser::Peek() const {
  return (index_ + 1 < input_.size()) ?
      static_cast<int>(input_[index_ + 1]) : -1;
}

// A linebreak after a restricted production ends the statement; the
// semicolon says so in one byte.
void Collapser::EmitLinebreak() {
  output_->push_back(prev_restricted_ ? ';' : '\n');
}

// Switch to a new prev_token, and insert a newline if necessary.  Call this
// right before appending a token onto the output.
void Collapser::ChangeToken(int next_token) {
  // If there've been any linebreaks since the previous token, we may need to
  // insert a linebreak here to avoid running afoul of semicolon insertion
  // (that is, the code may be relying on semicolon insertion here, and
  // removing the linebreak would break it).
  if (whitespace_ == kLinebreak &&
      !CanSuppressLinebreak(prev_token_, next_token)) {
    EmitLinebreak();
  }
  whitespace_ = kNoWhitespace;
  prev_token_ = next_token;
  prev_restricted_ = false;
  prev_integer_ = false;
}

// If there's been any whitespace since the previous token, insert some
// whitespace now to separate the previous token from the next token.
void Collapser::InsertSpaceIfNeeded() {
  switch (whitespace_) {
    case kSpace:
      output_->push_back(' ');
      break;
    case kLinebreak:
      EmitLinebreak();
      break;
    default:
      break;
  }
  whitespace_ = kNoWhitespace;
}

// Consume a keyword, name, number or placeholder.
void Collapser::ConsumeWord() {
  const StringPiece word = input_.substr(index_, WordLength(input_, index_));
  int token = kNameNumberToken;
  RegionKind kind;
  int region_index;
  if (RegionMap::ParsePlaceholder(word, &kind, &region_index) ==
      word.size()) {
    switch (kind) {
      case kImportantComment:
        token = kCommentToken;
        break;
      case kRegexLiteral:
        token = kRegexToken;
        break;
      default:
        token = kStringToken;
        break;
    }
  } else if (JsKeywords::CanKeywordPrecedeRegEx(word)) {
    // return/ x /g returns a regex literal, while reTurn/ x /g performs two
    // divisions.
    token = kKeywordCanPrecedeRegExToken;
  }
  if (IsWordToken(prev_token_)) {
    InsertSpaceIfNeeded();
  } else if (token == kRegexToken && prev_token_ == '/') {
    // Don't accidentally create a line comment.
    InsertSpaceIfNeeded();
  }
  ChangeToken(token);
  output_->append(word.data(), word.size());
  prev_restricted_ = JsKeywords::IsRestrictedProduction(word);
  prev_integer_ = IsDecimalInteger(word);
  index_ += word.size();
}

void Collapser::Collapse() {
  while (index_ < input_.size()) {
    const char ch = input_[index_];
    // Track whitespace since the previous token.  kNoWhitespace means no
    // whitespace; kLinebreak means there's been at least one linebreak; kSpace
    // means there's been spaces/tabs, but no linebreaks.
    if (ch == '\n' || ch == '\r') {
      whitespace_ = kLinebreak;
      ++index_;
    } else if (ch == ' ' || ch == '\t' || ch == '\f' || ch == '\v') {
      if (whitespace_ == kNoWhitespace) {
        whitespace_ = kSpace;
      }
      ++index_;
    } else if (IsIdentifierChar(ch)) {
      ConsumeWord();
    } else if (ch == '+' && Peek() == '+') {
      // Treat ++ differently than two +'s.  It has different whitespace rules:
      //   - A statement cannot ever end with +, but it can end with ++.  Thus,
      //     a linebreak after + can always be removed (no semicolon will be
      //     inserted), but a linebreak after ++ generally cannot.
      //   - A + at the start of a line can continue the previous line, but a ++
      //     cannot (a linebreak is _not_ permitted between i and ++ in an i++
      //     statement).  Thus, a linebreak just before a + can be removed in
      //     certain cases (if we can decide that a semicolon would not be
      //     inserted), but a linebreak just before a ++ never can.

      // Careful to leave whitespace so as not to create a +++ or ++++, which
      // can be ambiguous.
      if (prev_token_ == '+' || prev_token_ == kPlusPlusToken) {
        InsertSpaceIfNeeded();
      }
      ChangeToken(kPlusPlusToken);
      output_->append("++");
      index_ += 2;
    } else if (ch == '-' && Peek() == '-') {
      // Careful to leave whitespace so as not to create a --- or ----, which
      // can be ambiguous.  Also careful of !'s, since we don't want to
      // accidentally create an SGML line comment.
      if (prev_token_ == '-' || prev_token_ == kMinusMinusToken ||
          prev_token_ == '!') {
        InsertSpaceIfNeeded();
      }
      ChangeToken(kMinusMinusToken);
      output_->append("--");
      index_ += 2;
    } else {
      // Copy other characters over verbatim, but make sure not to join two +
      // tokens into ++ or two - tokens into --, or to join ++ and + into +++
      // or -- and - into ---, or to minify the sequence of tokens < ! - - into
      // an SGML line comment.  "1 .x" can not lose its space either.
      if ((prev_token_ == ch && (ch == '+' || ch == '-')) ||
          (prev_token_ == kPlusPlusToken && ch == '+') ||
          (prev_token_ == kMinusMinusToken && ch == '-') ||
          (prev_token_ == '<' && ch == '!') ||
          (prev_token_ == '!' && ch == '-') ||
          (prev_integer_ && ch == '.')) {
        InsertSpaceIfNeeded();
      }
      ChangeToken(static_cast<unsigned char>(ch));
      output_->push_back(ch);
      ++index_;
    }
  }
}

// Applies the token-level rewrites: shorter booleans, dot notation for
// constant property names, and redundant statement terminators.
class Rewriter {
 public:
  Rewriter(const MinifyOptions* options, const RegionMap& regions,
           StringPiece input, GoogleString* output)
      : options_(options),
        regions_(regions),
        input_(input),
        index_(0),
        output_(output),
        start_(output->size()),
        prev_type_(kPrevNone),
        prev_punct_('\0'),
        prev_placeholder_kind_(kStringLiteral),
        prev_closes_control_(false),
        semicolon_protected_(false) {
  }

  void Rewrite();

 private:
  enum PrevType {
    kPrevNone,
    kPrevWord,
    kPrevPlaceholder,
    kPrevPunct
  };

  struct Bracket {
    Bracket(char open_in, bool control_in, bool for_in)
        : open(open_in), control_header(control_in), for_header(for_in) {}
    char open;
    bool control_header;  // the clause of if, while, for, ...
    bool for_header;
  };

  void EmitWord(StringPiece word);
  void EmitPunct(char c);
  void EmitSemicolon();
  bool TryDotNotation();
  bool CanShortenBoolean(size_t after) const;
  bool IsOperand() const;
  bool PrevIsPunct(char c) const {
    return (prev_type_ == kPrevPunct) && (prev_punct_ == c);
  }
  bool PrevIsWord(StringPiece word) const {
    return (prev_type_ == kPrevWord) && (prev_word_ == word);
  }
  char LastOutputChar(size_t back) const;

  const MinifyOptions* options_;
  const RegionMap& regions_;
  const StringPiece input_;
  size_t index_;
  GoogleString* output_;
  const size_t start_;  // output_ size before rewriting started

  // The previous significant token.
  PrevType prev_type_;
  StringPiece prev_word_;
  char prev_punct_;
  RegionKind prev_placeholder_kind_;
  bool prev_closes_control_;
  // The last ';' written is an empty statement body and must stay.
  bool semicolon_protected_;

  std::vector<Bracket> brackets_;

  DISALLOW_COPY_AND_ASSIGN(Rewriter);
};

// The character written `back` positions before the end, or '\0'.
char Rewriter::LastOutputChar(size_t back) const {
  size_t written = output_->size() - start_;
  return (back < written) ? (*output_)[output_->size() - 1 - back] : '\0';
}

bool Rewriter::IsOperand() const {
  switch (prev_type_) {
    case kPrevPlaceholder:
      return prev_placeholder_kind_ != kImportantComment;
    case kPrevWord:
      if (prev_word_ == "this" || prev_word_ == "super") {
        return true;
      }
      return !IsDecimalDigit(prev_word_[0]) &&
          !JsKeywords::IsKeyword(prev_word_);
    case kPrevPunct:
      return (prev_punct_ == ']') ||
          ((prev_punct_ == ')') && !prev_closes_control_);
    case kPrevNone:
      return false;
  }
  return false;
}

// Whether the boolean literal ending at input_[after] may be written as
// !0 or !1.  Property names, object keys, method names, assignment targets
// private names, and operands of higher-precedence operators keep the
// literal.
bool Rewriter::CanShortenBoolean(size_t after) const {
  if (PrevIsPunct('.') || PrevIsPunct('#')) {
    return false;
  }
  size_t i = after;
  while (i < input_.size() && IsHtmlSpace(input_[i])) {
    ++i;
  }
  const char next = (i < input_.size()) ? input_[i] : '\0';
  const char next2 = (i + 1 < input_.size()) ? input_[i + 1] : '\0';
  switch (next) {
    case '(':
    case '.':
    case '[':
      return false;
    case '*':
      return next2 != '*';
    case '=':
      return next2 == '=';
    case '?':
      return next2 != '.';
    case ':':
      return !PrevIsPunct('{') && !PrevIsPunct(',');
    default:
      return true;
  }
}

void Rewriter::EmitWord(StringPiece word) {
  RegionKind kind;
  int region_index;
  if (RegionMap::ParsePlaceholder(word, &kind, &region_index) ==
      word.size()) {
    output_->append(word.data(), word.size());
    prev_type_ = kPrevPlaceholder;
    prev_placeholder_kind_ = kind;
    return;
  }
  if (options_->js_shorten_booleans() &&
      (word == "true" || word == "false") &&
      CanShortenBoolean(index_ + word.size())) {
    // "return true" becomes "return!0".  A space after an operator stays,
    // since "a+ +true" must not become "a++!0".
    if (LastOutputChar(0) == ' ' && IsIdentifierChar(LastOutputChar(1))) {
      output_->resize(output_->size() - 1);
    }
    output_->append((word == "true") ? "!0" : "!1");
  } else {
    output_->append(word.data(), word.size());
  }
  prev_type_ = kPrevWord;
  prev_word_ = word;
}

// Rewrites [___STRING_n___] to .name when the string is a plain
// identifier.  Returns false, consuming nothing, if it does not apply.
bool Rewriter::TryDotNotation() {
  if (!IsOperand()) {
    return false;
  }
  StringPiece rest = input_.substr(index_ + 1);
  RegionKind kind;
  int region_index;
  size_t length = RegionMap::ParsePlaceholder(rest, &kind, &region_index);
  if (length == 0 || kind != kStringLiteral ||
      region_index >= regions_.size()) {
    return false;
  }
  size_t close = index_ + 1 + length;
  if (close >= input_.size() || input_[close] != ']') {
    return false;
  }
  // x["a"]in y can not become x.ain y.
  if (close + 1 < input_.size() && IsIdentifierChar(input_[close + 1])) {
    return false;
  }
  const ProtectedRegion& region = regions_.region(region_index);
  if (region.placeholder != rest.substr(0, length) ||
      region.original_text.size() < 2) {
    return false;
  }
  StringPiece name(region.original_text);
  name = name.substr(1, name.size() - 2);
  static const RE2 identifier_pattern("[A-Za-z_$][A-Za-z0-9_$]*");
  if (!RE2::FullMatch(StringPieceToRe2(name), identifier_pattern) ||
      JsKeywords::IsKeyword(name)) {
    return false;
  }
  output_->push_back('.');
  output_->append(name.data(), name.size());
  prev_type_ = kPrevWord;
  prev_word_ = name;
  index_ = close + 1;
  return true;
}

void Rewriter::EmitSemicolon() {
  const bool in_for_header =
      !brackets_.empty() && brackets_.back().for_header;
  if (in_for_header) {
    output_->push_back(';');
    semicolon_protected_ = true;
  } else {
    // An empty statement body: if(x);  else;  do;while(x)  label:;
    const bool empty_body =
        (PrevIsPunct(')') && prev_closes_control_) ||
        PrevIsWord("else") || PrevIsWord("do") || PrevIsPunct(':');
    if (!empty_body && PrevIsPunct(';') && LastOutputChar(0) == ';') {
      return;
    }
    output_->push_back(';');
    semicolon_protected_ = empty_body;
  }
  prev_type_ = kPrevPunct;
  prev_punct_ = ';';
  prev_closes_control_ = false;
}

void Rewriter::EmitPunct(char c) {
  if (c == ';') {
    EmitSemicolon();
    return;
  }
  bool closes_control = false;
  switch (c) {
    case '(':
      brackets_.push_back(Bracket(
          c,
          (prev_type_ == kPrevWord) &&
              JsKeywords::StartsControlHeader(prev_word_),
          PrevIsWord("for")));
      break;
    case '[':
    case '{':
      brackets_.push_back(Bracket(c, false, false));
      break;
    case '}':
      if (PrevIsPunct(';') && !semicolon_protected_ &&
          LastOutputChar(0) == ';') {
        output_->resize(output_->size() - 1);
      }
      if (!brackets_.empty()) {
        brackets_.pop_back();
      }
      break;
    case ')':
      if (!brackets_.empty()) {
        closes_control = brackets_.back().control_header;
        brackets_.pop_back();
      }
      break;
    case ']':
      if (!brackets_.empty()) {
        brackets_.pop_back();
      }
      break;
    default:
      break;
  }
  output_->push_back(c);
  prev_type_ = kPrevPunct;
  prev_punct_ = c;
  prev_closes_control_ = closes_control;
}

void Rewriter::Rewrite() {
  while (index_ < input_.size()) {
    const char c = input_[index_];
    if (IsHtmlSpace(c)) {
      output_->push_back(c);
      ++index_;
    } else if (IsIdentifierChar(c)) {
      StringPiece word = input_.substr(index_, WordLength(input_, index_));
      EmitWord(word);
      index_ += word.size();
    } else if (c == '[' && options_->js_dot_notation() && TryDotNotation()) {
      continue;
    } else {
      EmitPunct(c);
      ++index_;
    }
  }
}

}  // namespace

JsRuleSet::JsRuleSet(const MinifyOptions* options)
    : options_(options),
      extractor_(kJsLanguage) {
  extractor_.AddScanner(new ImportantCommentScanner);
  extractor_.AddScanner(new ConditionalCommentScanner);
  extractor_.AddScanner(new QuotedStringScanner);
  extractor_.AddScanner(new TemplateScanner);
  extractor_.AddScanner(new RegexScanner);
}

JsRuleSet::~JsRuleSet() {
}

MinifyStatus JsRuleSet::ExtractRegions(StringPiece input,
                                       GoogleString* output,
                                       RegionMap* regions) const {
  return extractor_.Extract(input, output, regions);
}

MinifyStatus JsRuleSet::StripComments(StringPiece input,
                                      GoogleString* output) const {
  size_t pos = 0;
  while (pos < input.size()) {
    size_t slash = input.find('/', pos);
    if (slash == StringPiece::npos) {
      output->append(input.data() + pos, input.size() - pos);
      break;
    }
    output->append(input.data() + pos, slash - pos);
    const char next = (slash + 1 < input.size()) ? input[slash + 1] : '\0';
    if (next == '/') {
      // The line break itself is kept.
      pos = input.find_first_of("\r\n", slash);
      if (pos == StringPiece::npos) {
        pos = input.size();
      }
    } else if (next == '*') {
      size_t close = input.find("*/", slash + 2);
      if (close == StringPiece::npos) {
        return kMalformedInput;
      }
      StringPiece body = input.substr(slash + 2, close - slash - 2);
      bool multiline = (body.find_first_of("\r\n") != StringPiece::npos);
      output->push_back(multiline ? '\n' : ' ');
      pos = close + 2;
    } else {
      output->push_back('/');
      pos = slash + 1;
    }
  }
  return kMinifyOk;
}

MinifyStatus JsRuleSet::Collapse(StringPiece input,
                                 GoogleString* output) const {
  Collapser collapser(input, output);
  collapser.Collapse();
  return kMinifyOk;
}

MinifyStatus JsRuleSet::Rewrite(StringPiece input, const RegionMap& regions,
                                GoogleString* output) const {
  Rewriter rewriter(options_, regions, input, output);
  rewriter.Rewrite();
  return kMinifyOk;
}

}  // namespace js

}  // namespace assetspeed
