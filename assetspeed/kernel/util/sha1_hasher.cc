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
#include "assetspeed/kernel/util/sha1_hasher.h"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include "absl/strings/escaping.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

// 20 raw bytes web64-encode to 26 usable characters.
const int Sha1Hasher::kDefaultHashSize = SHA_DIGEST_LENGTH * 4 / 3;

Sha1Hasher::Sha1Hasher() : Hasher(kDefaultHashSize) {
}

Sha1Hasher::Sha1Hasher(int max_chars) : Hasher(max_chars) {
}

Sha1Hasher::~Sha1Hasher() {
}

GoogleString Sha1Hasher::RawHash(StringPiece content) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_size = 0;
  if (EVP_Digest(content.data(), content.size(), digest, &digest_size,
                 EVP_sha1(), NULL) != 1) {
    // Only fails on allocation failure inside libcrypto.  An empty digest
    // is never equal to a real one, so callers see a key that never hits.
    return GoogleString();
  }
  return GoogleString(reinterpret_cast<const char*>(digest), digest_size);
}

int Sha1Hasher::RawHashSizeInBytes() const {
  return SHA_DIGEST_LENGTH;
}

GoogleString Sha1Hasher::HexDigest(StringPiece raw_hash) {
  return absl::BytesToHexString(raw_hash);
}

}  // namespace assetspeed
