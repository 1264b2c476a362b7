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
#ifndef ASSETSPEED_KERNEL_BASE_HASHER_H_
#define ASSETSPEED_KERNEL_BASE_HASHER_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class Hasher {
 public:
  // The passed in max_chars will be used to limit the length of
  // Hash() results.
  explicit Hasher(int max_chars);
  virtual ~Hasher();

  // Computes a web64-encoded hash of a single string.  This
  // operation is thread-safe.
  //
  // This is implemented in terms of RawHash, and honors the length limit
  // passed in to the constructor.
  GoogleString Hash(StringPiece content) const;

  // Return string length of hashes produced by this hasher's Hash
  // method.
  int HashSizeInChars() const;

  // Computes a binary hash of the given content. The returned value
  // is not printable as it is the direct binary encoding of the hash.
  // This operation is thread-safe.
  virtual GoogleString RawHash(StringPiece content) const = 0;

  // The number of bytes RawHash will produce.
  virtual int RawHashSizeInBytes() const = 0;

 private:
  int max_chars_;

  DISALLOW_COPY_AND_ASSIGN(Hasher);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_HASHER_H_
