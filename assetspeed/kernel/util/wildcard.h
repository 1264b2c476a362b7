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


#ifndef ASSETSPEED_KERNEL_UTIL_WILDCARD_H_
#define ASSETSPEED_KERNEL_UTIL_WILDCARD_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/scoped_ptr.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/util/re2.h"

namespace assetspeed {

// A shell-style glob: '*' matches any run of characters (including none)
// and '?' matches exactly one.  Every other character matches itself.
// Matching is against the whole string.
class Wildcard {
 public:
  static const char kMatchAny;  // *
  static const char kMatchOne;  // ?

  explicit Wildcard(StringPiece wildcard_spec);
  ~Wildcard();

  // Determines whether a string matches the wildcard.
  bool Match(StringPiece str) const;

  // Determines whether this wildcard is just a simple name, lacking any
  // wildcard characters.
  bool IsSimple() const { return is_simple_; }

  // Returns the original wildcard specification.
  const GoogleString& spec() const { return spec_; }

  // Makes a duplicate copy of the wildcard object.
  Wildcard* Duplicate() const;

 private:
  GoogleString spec_;
  bool is_simple_;
  scoped_ptr<RE2> regexp_;

  DISALLOW_COPY_AND_ASSIGN(Wildcard);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_UTIL_WILDCARD_H_
