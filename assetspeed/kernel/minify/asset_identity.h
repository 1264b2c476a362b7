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


#ifndef ASSETSPEED_KERNEL_MINIFY_ASSET_IDENTITY_H_
#define ASSETSPEED_KERNEL_MINIFY_ASSET_IDENTITY_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

class Hasher;

// What an asset is: its registered handle, a digest of its raw bytes, and
// the modification time of its source file.  Any change to the file
// yields a different identity, which is how cached output is invalidated.
class AssetIdentity {
 public:
  // Bytes in a SHA-1 digest.
  static const int kContentHashSize = 20;

  AssetIdentity(StringPiece handle, StringPiece content_hash,
                int64 source_mtime)
      : handle_(handle),
        content_hash_(content_hash),
        source_mtime_(source_mtime) {
  }

  // Computes the content hash of raw_text with content_hasher's RawHash.
  static AssetIdentity Create(StringPiece handle, StringPiece raw_text,
                              int64 source_mtime,
                              const Hasher* content_hasher);

  const GoogleString& handle() const { return handle_; }
  // Raw digest bytes, not printable.
  const GoogleString& content_hash() const { return content_hash_; }
  int64 source_mtime() const { return source_mtime_; }

  // Whether content_hash has the size of a SHA-1 digest.  Identities
  // without one can not be used as cache keys.
  bool HasValidContentHash() const {
    return static_cast<int>(content_hash_.size()) == kContentHashSize;
  }

  bool Equals(const AssetIdentity& other) const {
    return (handle_ == other.handle_) &&
        (content_hash_ == other.content_hash_) &&
        (source_mtime_ == other.source_mtime_);
  }

  // Serializes the three fields with length prefixes, so that no two
  // distinct identities produce the same string.  Input to the cache key.
  GoogleString KeyMaterial() const;

 private:
  // Copyable, but never modified after construction.
  GoogleString handle_;
  GoogleString content_hash_;
  int64 source_mtime_;
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_MINIFY_ASSET_IDENTITY_H_
