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


#include "assetspeed/kernel/css/css_minify.h"

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/css/css_scanners.h"
#include "assetspeed/kernel/minify/minify_options.h"
#include "assetspeed/kernel/minify/protected_region.h"

namespace assetspeed {

namespace css {

namespace {

bool IsOneOf(char c, const char* chars) {
  for (; *chars != '\0'; ++chars) {
    if (c == *chars) {
      return true;
    }
  }
  return false;
}

// Whether the text starting at pos up to the next '{', ';' or '}' is a
// selector or at-rule prelude, i.e. whether '{' comes first.
bool StartsSelector(StringPiece input, size_t pos) {
  size_t sep = input.find_first_of("{;}", pos);
  return (sep != StringPiece::npos) && (input[sep] == '{');
}

bool DropsSpaceBetween(char prev, char next, bool in_selector) {
  if (IsOneOf(prev, "{};,!(:") || IsOneOf(next, "{};,!)")) {
    return true;
  }
  // In a selector, " :hover" is a descendant combinator.
  if (next == ':' && !in_selector) {
    return true;
  }
  // In a declaration value, "1px +2px" is two values.
  return in_selector && (IsOneOf(prev, ">~+") || IsOneOf(next, ">~+"));
}

// Characters that make a following digit part of a larger token, such as
// an identifier, a hash or a longer number.
bool IsNumberJoinChar(char c) {
  return IsWordChar(kCssLanguage, c) || (c == '.') || (c == '#');
}

bool StartsNumber(StringPiece text, size_t pos) {
  if (pos >= text.size()) {
    return false;
  }
  return IsDecimalDigit(text[pos]) ||
      ((text[pos] == '.') && (pos + 1 < text.size()) &&
       IsDecimalDigit(text[pos + 1]));
}

bool IsCustomProperty(StringPiece property) {
  TrimWhitespace(&property);
  return HasPrefixString(property, "--");
}

bool IsZero(StringPiece number) {
  for (size_t i = 0; i < number.size(); ++i) {
    if (number[i] != '0' && number[i] != '.') {
      return false;
    }
  }
  return true;
}

// #aabbcc can be written #abc.
bool IsCompressibleHex(StringPiece digits) {
  if (digits.size() != 6) {
    return false;
  }
  for (size_t i = 0; i < digits.size(); ++i) {
    if (!IsHexDigit(digits[i])) {
      return false;
    }
  }
  return (digits[0] == digits[1]) && (digits[2] == digits[3]) &&
      (digits[4] == digits[5]);
}

}  // namespace

CssRuleSet::CssRuleSet(const MinifyOptions* options)
    : options_(options),
      extractor_(kCssLanguage) {
  extractor_.AddScanner(new ImportantCommentScanner);
  extractor_.AddScanner(new UrlScanner);
  extractor_.AddScanner(new CalcScanner);
  extractor_.AddScanner(new QuotedStringScanner);
}

CssRuleSet::~CssRuleSet() {
}

MinifyStatus CssRuleSet::ExtractRegions(StringPiece input,
                                        GoogleString* output,
                                        RegionMap* regions) const {
  return extractor_.Extract(input, output, regions);
}

MinifyStatus CssRuleSet::StripComments(StringPiece input,
                                       GoogleString* output) const {
  const size_t start = output->size();
  size_t pos = 0;
  while (pos < input.size()) {
    size_t open = input.find("/*", pos);
    if (open == StringPiece::npos) {
      output->append(input.data() + pos, input.size() - pos);
      break;
    }
    output->append(input.data() + pos, open - pos);
    size_t close = input.find("*/", open + 2);
    if (close == StringPiece::npos) {
      return kMalformedInput;
    }
    pos = close + 2;
    char before = (output->size() > start) ? (*output)[output->size() - 1]
                                           : '\0';
    char after = (pos < input.size()) ? input[pos] : '\0';
    if (IsWordChar(kCssLanguage, before) && IsWordChar(kCssLanguage, after)) {
      output->push_back(' ');
    }
  }
  return kMinifyOk;
}

MinifyStatus CssRuleSet::Collapse(StringPiece input,
                                  GoogleString* output) const {
  const size_t start = output->size();
  bool in_selector = StartsSelector(input, 0);
  bool pending_space = false;
  for (size_t i = 0; i < input.size(); ++i) {
    const char c = input[i];
    if (IsHtmlSpace(c)) {
      pending_space = true;
      continue;
    }
    const bool have_prev = (output->size() > start);
    const char prev = have_prev ? (*output)[output->size() - 1] : '\0';
    if (pending_space && have_prev &&
        !DropsSpaceBetween(prev, c, in_selector)) {
      output->push_back(' ');
    }
    pending_space = false;
    if (c == ';' && prev == ';') {
      continue;
    }
    if (c == '}' && prev == ';') {
      output->resize(output->size() - 1);
    }
    output->push_back(c);
    if (IsOneOf(c, "{;}")) {
      in_selector = StartsSelector(input, i + 1);
    }
  }
  return kMinifyOk;
}

MinifyStatus CssRuleSet::Rewrite(StringPiece input, const RegionMap& regions,
                                 GoogleString* output) const {
  size_t pos = 0;
  while (pos < input.size()) {
    size_t sep = input.find_first_of("{;}", pos);
    size_t segment_end = (sep == StringPiece::npos) ? input.size() : sep;
    StringPiece segment = input.substr(pos, segment_end - pos);
    bool declaration = (sep == StringPiece::npos) || (input[sep] != '{');
    size_t colon = segment.find(':');
    if (declaration && colon != StringPiece::npos &&
        !IsCustomProperty(segment.substr(0, colon)) &&
        FindIgnoreCase(segment, "progid:") == StringPiece::npos) {
      output->append(segment.data(), colon + 1);
      RewriteValue(segment.substr(colon + 1), output);
    } else {
      output->append(segment.data(), segment.size());
    }
    if (sep == StringPiece::npos) {
      break;
    }
    output->push_back(input[sep]);
    pos = sep + 1;
  }
  return kMinifyOk;
}

void CssRuleSet::RewriteValue(StringPiece value, GoogleString* output) const {
  size_t i = 0;
  while (i < value.size()) {
    const char c = value[i];
    const char prev = (i > 0) ? value[i - 1] : ':';
    if (c == '#') {
      size_t end = i + 1;
      while (end < value.size() && IsWordChar(kCssLanguage, value[end])) {
        ++end;
      }
      StringPiece digits = value.substr(i + 1, end - i - 1);
      output->push_back('#');
      if (options_->css_compress_hex_colors() && IsCompressibleHex(digits)) {
        output->push_back(digits[0]);
        output->push_back(digits[2]);
        output->push_back(digits[4]);
      } else {
        output->append(digits.data(), digits.size());
      }
      i = end;
    } else if (StartsNumber(value, i) && !IsNumberJoinChar(prev)) {
      i = RewriteNumber(value, i, false, output);
    } else if (c == '-' && StartsNumber(value, i + 1) &&
               !IsNumberJoinChar(prev)) {
      output->push_back('-');
      i = RewriteNumber(value, i + 1, true, output);
    } else if (IsWordChar(kCssLanguage, c)) {
      // Identifiers and placeholders are copied whole so digits inside
      // them are never taken for numbers.
      size_t end = i + 1;
      while (end < value.size() && IsWordChar(kCssLanguage, value[end])) {
        ++end;
      }
      output->append(value.data() + i, end - i);
      i = end;
    } else {
      output->push_back(c);
      ++i;
    }
  }
}

size_t CssRuleSet::RewriteNumber(StringPiece value, size_t pos, bool negative,
                                 GoogleString* output) const {
  size_t end = pos;
  while (end < value.size() && IsDecimalDigit(value[end])) {
    ++end;
  }
  const size_t integer_end = end;
  if (end + 1 < value.size() && value[end] == '.' &&
      IsDecimalDigit(value[end + 1])) {
    ++end;
    while (end < value.size() && IsDecimalDigit(value[end])) {
      ++end;
    }
  }
  StringPiece number = value.substr(pos, end - pos);
  size_t unit_end = end;
  while (unit_end < value.size() && IsAsciiAlpha(value[unit_end])) {
    ++unit_end;
  }
  if (unit_end == end && unit_end < value.size() && value[unit_end] == '%') {
    ++unit_end;
  }
  StringPiece unit = value.substr(end, unit_end - end);

  // Exponents, and anything else glued on, are left alone.
  if (unit_end < value.size() && IsWordChar(kCssLanguage, value[unit_end])) {
    output->append(value.data() + pos, unit_end - pos);
    return unit_end;
  }

  if (!negative && IsZero(number) && !unit.empty() &&
      options_->IsZeroStrippableUnit(unit)) {
    output->push_back('0');
    return unit_end;
  }

  const bool has_fraction = (end > integer_end);
  if (has_fraction && (integer_end - pos == 1) && (value[pos] == '0')) {
    bool strip = negative ? options_->css_strip_negative_leading_zero()
                          : options_->css_strip_leading_zero();
    if (strip) {
      number.remove_prefix(1);
    }
  }
  output->append(number.data(), number.size());
  output->append(unit.data(), unit.size());
  return unit_end;
}

}  // namespace css

}  // namespace assetspeed
