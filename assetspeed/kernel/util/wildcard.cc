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


#include "assetspeed/kernel/util/wildcard.h"

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/util/re2.h"

namespace assetspeed {

const char Wildcard::kMatchAny = '*';
const char Wildcard::kMatchOne = '?';

namespace {

// Translates a glob into an anchored RE2 pattern.  Runs of '*' are
// collapsed, since '**' matches the same strings as '*'.
GoogleString GlobToRegexp(StringPiece spec) {
  GoogleString regexp;
  size_t literal_start = 0;
  bool last_was_any = false;
  for (size_t i = 0; i <= spec.size(); ++i) {
    if (i < spec.size() &&
        spec[i] != Wildcard::kMatchAny && spec[i] != Wildcard::kMatchOne) {
      last_was_any = false;
      continue;
    }
    if (i > literal_start) {
      regexp += RE2::QuoteMeta(StringPieceToRe2(
          spec.substr(literal_start, i - literal_start)));
    }
    literal_start = i + 1;
    if (i == spec.size()) {
      break;
    }
    if (spec[i] == Wildcard::kMatchOne) {
      regexp += ".";
      last_was_any = false;
    } else if (!last_was_any) {
      regexp += ".*";
      last_was_any = true;
    }
  }
  return regexp;
}

RE2::Options WildcardOptions() {
  RE2::Options options;
  options.set_dot_nl(true);
  options.set_log_errors(false);
  options.set_encoding(RE2::Options::EncodingLatin1);
  return options;
}

}  // namespace

Wildcard::Wildcard(StringPiece wildcard_spec)
    : spec_(wildcard_spec),
      is_simple_(wildcard_spec.find_first_of("*?") == StringPiece::npos),
      regexp_(new RE2(GlobToRegexp(wildcard_spec), WildcardOptions())) {
}

Wildcard::~Wildcard() {
}

bool Wildcard::Match(StringPiece str) const {
  if (is_simple_) {
    return str == spec_;
  }
  return regexp_->ok() && RE2::FullMatch(StringPieceToRe2(str), *regexp_);
}

Wildcard* Wildcard::Duplicate() const {
  return new Wildcard(spec_);
}

}  // namespace assetspeed
