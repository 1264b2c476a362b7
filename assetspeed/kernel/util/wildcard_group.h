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


#ifndef ASSETSPEED_KERNEL_UTIL_WILDCARD_GROUP_H_
#define ASSETSPEED_KERNEL_UTIL_WILDCARD_GROUP_H_

#include <vector>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class Wildcard;

// This forms the basis of a wildcard selection mechanism, allowing
// a user to issue a sequence of commands like:
//
//   1. allow *.js
//   2. disallow *.min.js
//   3. allow jquery.min.js
//
// The last command that matches a string wins.
class WildcardGroup {
 public:
  WildcardGroup() {}
  ~WildcardGroup();

  // Determines whether a string is allowed by the wildcard group.  If none
  // of the wildcards in the group matches, allow is returned as a default.
  bool Match(StringPiece str, bool allow) const;

  // Like Match, but a wildcard without '*' or '?' characters also matches
  // when it occurs anywhere inside str.
  bool MatchOrContains(StringPiece str, bool allow) const;

  void Allow(StringPiece wildcard);
  void Disallow(StringPiece wildcard);

  void Clear();
  bool empty() const { return wildcards_.empty(); }
  int size() const { return static_cast<int>(wildcards_.size()); }

  void CopyFrom(const WildcardGroup& src);
  void AppendFrom(const WildcardGroup& src);

  // Returns a string that uniquely identifies the allow/disallow sequence.
  GoogleString Signature() const;

 private:
  std::vector<Wildcard*> wildcards_;
  std::vector<bool> allow_;

  DISALLOW_COPY_AND_ASSIGN(WildcardGroup);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_UTIL_WILDCARD_GROUP_H_
