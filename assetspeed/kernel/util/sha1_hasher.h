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
#ifndef ASSETSPEED_KERNEL_UTIL_SHA1_HASHER_H_
#define ASSETSPEED_KERNEL_UTIL_SHA1_HASHER_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/hasher.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

// SHA-1 via OpenSSL.  Used both for asset content digests (the full 160
// bits, from RawHash) and for cache keys (web64, from Hash).
class Sha1Hasher : public Hasher {
 public:
  static const int kDefaultHashSize;

  Sha1Hasher();
  explicit Sha1Hasher(int max_chars);
  ~Sha1Hasher() override;

  GoogleString RawHash(StringPiece content) const override;
  int RawHashSizeInBytes() const override;

  // Lowercase hex form of a raw digest, for logging.
  static GoogleString HexDigest(StringPiece raw_hash);

 private:
  DISALLOW_COPY_AND_ASSIGN(Sha1Hasher);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_UTIL_SHA1_HASHER_H_
