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


#include "assetspeed/kernel/minify/protected_region.h"

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/util/re2.h"

namespace assetspeed {

namespace {

const char kPlaceholderFence[] = "___";
const size_t kPlaceholderFenceLength = sizeof(kPlaceholderFence) - 1;

const RegionKind kAllKinds[] = {
  kImportantComment,
  kStringLiteral,
  kRegexLiteral,
  kTemplateLiteral,
  kDataUri,
  kCalcExpr,
  kUrlReference
};

}  // namespace

const char* RegionKindPlaceholderName(RegionKind kind) {
  switch (kind) {
    case kImportantComment:
      return "COMMENT";
    case kStringLiteral:
      return "STRING";
    case kRegexLiteral:
      return "REGEX";
    case kTemplateLiteral:
      return "TEMPLATE";
    case kDataUri:
      return "DATAURI";
    case kCalcExpr:
      return "CALC";
    case kUrlReference:
      return "URL";
  }
  return "UNKNOWN";
}

RegionMap::RegionMap() {
}

RegionMap::~RegionMap() {
}

const GoogleString& RegionMap::Add(RegionKind kind,
                                   StringPiece original_text) {
  GoogleString placeholder =
      StrCat(kPlaceholderFence, RegionKindPlaceholderName(kind), "_",
             regions_.size(), kPlaceholderFence);
  regions_.push_back(ProtectedRegion(placeholder, original_text, kind));
  return regions_.back().placeholder;
}

size_t RegionMap::ParsePlaceholder(StringPiece text, RegionKind* kind,
                                   int* index) {
  if (!HasPrefixString(text, kPlaceholderFence)) {
    return 0;
  }
  size_t pos = kPlaceholderFenceLength;
  for (size_t k = 0; k < arraysize(kAllKinds); ++k) {
    StringPiece name(RegionKindPlaceholderName(kAllKinds[k]));
    StringPiece rest = text.substr(pos);
    if (!HasPrefixString(rest, name) || rest.size() <= name.size() ||
        rest[name.size()] != '_') {
      continue;
    }
    size_t digits_start = pos + name.size() + 1;
    size_t digits_end = digits_start;
    while (digits_end < text.size() && IsDecimalDigit(text[digits_end])) {
      ++digits_end;
    }
    // Cap the number of digits so the index cannot overflow.
    if (digits_end == digits_start || digits_end - digits_start > 9 ||
        !HasPrefixString(text.substr(digits_end), kPlaceholderFence)) {
      return 0;
    }
    int value = 0;
    for (size_t i = digits_start; i < digits_end; ++i) {
      value = value * 10 + (text[i] - '0');
    }
    *kind = kAllKinds[k];
    *index = value;
    return digits_end + kPlaceholderFenceLength;
  }
  return 0;
}

const ProtectedRegion* RegionMap::FindAtStart(StringPiece text,
                                              size_t* length) const {
  RegionKind kind;
  int index;
  size_t placeholder_length = ParsePlaceholder(text, &kind, &index);
  if (placeholder_length == 0 || index >= size() ||
      regions_[index].kind != kind) {
    return NULL;
  }
  *length = placeholder_length;
  return &regions_[index];
}

void RegionMap::Restore(StringPiece text, GoogleString* out) const {
  out->reserve(out->size() + text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t fence = text.find(kPlaceholderFence, pos);
    if (fence == StringPiece::npos) {
      break;
    }
    out->append(text.data() + pos, fence - pos);
    size_t length = 0;
    const ProtectedRegion* region = FindAtStart(text.substr(fence), &length);
    if (region != NULL) {
      out->append(region->original_text);
      pos = fence + length;
    } else {
      // A longer run of underscores may still end in a placeholder, so
      // only step over one character.
      out->push_back(text[fence]);
      pos = fence + 1;
    }
  }
  if (pos < text.size()) {
    out->append(text.data() + pos, text.size() - pos);
  }
}

bool RegionMap::ContainsPlaceholderSyntax(StringPiece text) {
  static const RE2 placeholder_pattern(
      "___(COMMENT|STRING|REGEX|TEMPLATE|DATAURI|CALC|URL)_[0-9]+___");
  if (text.find(kPlaceholderFence) == StringPiece::npos) {
    return false;
  }
  return RE2::PartialMatch(StringPieceToRe2(text), placeholder_pattern);
}

}  // namespace assetspeed
