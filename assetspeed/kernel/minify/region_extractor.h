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


#ifndef ASSETSPEED_KERNEL_MINIFY_REGION_EXTRACTOR_H_
#define ASSETSPEED_KERNEL_MINIFY_REGION_EXTRACTOR_H_

#include <cstddef>
#include <vector>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/minify/minify_status.h"
#include "assetspeed/kernel/minify/protected_region.h"

namespace assetspeed {

// Whether c can appear inside a word of the given language.  Bytes >= 0x80
// are treated as word characters so UTF-8 identifiers stay whole.  CSS
// words also contain '-'.
inline bool IsWordChar(AssetLanguage language, char c) {
  return IsAsciiAlpha(c) || IsDecimalDigit(c) || (c == '_') ||
      (static_cast<unsigned char>(c) >= 0x80) ||
      ((language == kJsLanguage) ? (c == '$') : (c == '-'));
}

// The significant token preceding the current scan position.  Whitespace,
// ordinary comments and important-comment placeholders leave it unchanged.
class LexicalContext {
 public:
  enum TokenType {
    kStartOfInput,
    kWord,       // identifier, keyword or number
    kPunct,      // single punctuation character
    kIncrement,  // ++ or --
    kOperand     // string, template or regex placeholder
  };

  LexicalContext() : type_(kStartOfInput), punct_('\0') {}

  TokenType type() const { return type_; }
  StringPiece word() const { return word_; }
  char punct() const { return punct_; }

  void SetWord(StringPiece word) {
    type_ = kWord;
    word_ = word;
  }
  void SetPunct(char c) {
    type_ = kPunct;
    punct_ = c;
  }
  void SetIncrement() { type_ = kIncrement; }
  void SetOperand() { type_ = kOperand; }

  // Whether a '/' in this context starts a regular expression literal
  // rather than a division.
  bool RegexAllowed() const;

 private:
  TokenType type_;
  StringPiece word_;  // Points into the text being scanned.
  char punct_;
};

// Recognizes one family of protected regions.  Scanners are consulted in
// priority order at every position that can begin a token.
class RegionScanner {
 public:
  enum Result {
    kNoMatch,
    kMatched,
    // The region starts here but never ends.
    kUnterminated
  };

  RegionScanner() {}
  virtual ~RegionScanner();

  // Tries to match a region starting at input[pos].  On kMatched, *end is
  // one past the region and *kind says what was found.
  virtual Result Scan(StringPiece input, size_t pos,
                      const LexicalContext& context, size_t* end,
                      RegionKind* kind) const = 0;

  // The text to record for a matched region.  Defaults to the matched
  // text verbatim.
  virtual GoogleString ProtectedText(StringPiece matched,
                                     RegionKind kind) const;

 private:
  DISALLOW_COPY_AND_ASSIGN(RegionScanner);
};

// /*! ... */ comments, kept verbatim in the output.
class ImportantCommentScanner : public RegionScanner {
 public:
  ImportantCommentScanner() {}
  Result Scan(StringPiece input, size_t pos, const LexicalContext& context,
              size_t* end, RegionKind* kind) const override;
};

// '...' and "..." strings.  Backslash escapes are honored, including
// escaped line breaks.  A raw line break ends the string as malformed.
class QuotedStringScanner : public RegionScanner {
 public:
  QuotedStringScanner() {}
  Result Scan(StringPiece input, size_t pos, const LexicalContext& context,
              size_t* end, RegionKind* kind) const override;

  // Scans a quoted string starting at input[pos], which must be a quote
  // character.  Returns the offset one past the closing quote, or npos.
  static size_t FindStringEnd(StringPiece input, size_t pos);
};

// Replaces protected regions of a text by placeholders in a single left
// to right scan.  Ordinary comments are copied through unscanned, so a
// quote inside a comment never opens a string.
class RegionExtractor {
 public:
  explicit RegionExtractor(AssetLanguage language);
  ~RegionExtractor();

  // Takes ownership.  Scanners are tried in the order they are added.
  void AddScanner(RegionScanner* scanner);

  // Writes input with every protected region replaced by its placeholder
  // to *output, recording the regions in *regions.
  MinifyStatus Extract(StringPiece input, GoogleString* output,
                       RegionMap* regions) const;

 private:
  AssetLanguage language_;
  std::vector<RegionScanner*> scanners_;

  DISALLOW_COPY_AND_ASSIGN(RegionExtractor);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_MINIFY_REGION_EXTRACTOR_H_
