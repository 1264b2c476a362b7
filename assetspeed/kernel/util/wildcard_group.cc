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


#include "assetspeed/kernel/util/wildcard_group.h"

#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/util/wildcard.h"

namespace assetspeed {

WildcardGroup::~WildcardGroup() {
  Clear();
}

void WildcardGroup::Clear() {
  for (int i = 0, n = wildcards_.size(); i < n; ++i) {
    delete wildcards_[i];
  }
  wildcards_.clear();
  allow_.clear();
}

void WildcardGroup::Allow(StringPiece expr) {
  wildcards_.push_back(new Wildcard(expr));
  allow_.push_back(true);
}

void WildcardGroup::Disallow(StringPiece expr) {
  wildcards_.push_back(new Wildcard(expr));
  allow_.push_back(false);
}

bool WildcardGroup::Match(StringPiece str, bool allow) const {
  for (int i = wildcards_.size() - 1; i >= 0; --i) {
    // Match from last-inserted to first-inserted, returning status of
    // last-inserted match found.
    if (wildcards_[i]->Match(str)) {
      return allow_[i];
    }
  }
  return allow;
}

bool WildcardGroup::MatchOrContains(StringPiece str, bool allow) const {
  for (int i = wildcards_.size() - 1; i >= 0; --i) {
    const Wildcard* wildcard = wildcards_[i];
    if (wildcard->Match(str) ||
        (wildcard->IsSimple() && !wildcard->spec().empty() &&
         str.find(wildcard->spec()) != StringPiece::npos)) {
      return allow_[i];
    }
  }
  return allow;
}

void WildcardGroup::CopyFrom(const WildcardGroup& src) {
  Clear();
  AppendFrom(src);
}

void WildcardGroup::AppendFrom(const WildcardGroup& src) {
  for (int i = 0, n = src.wildcards_.size(); i < n; ++i) {
    wildcards_.push_back(src.wildcards_[i]->Duplicate());
    allow_.push_back(src.allow_[i]);
  }
}

GoogleString WildcardGroup::Signature() const {
  GoogleString signature;
  for (int i = 0, n = wildcards_.size(); i < n; ++i) {
    StrAppend(&signature, wildcards_[i]->spec(), (allow_[i] ? "A" : "D"), ",");
  }
  return signature;
}

}  // namespace assetspeed
