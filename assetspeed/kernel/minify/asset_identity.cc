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


#include "assetspeed/kernel/minify/asset_identity.h"

#include "assetspeed/kernel/base/hasher.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

AssetIdentity AssetIdentity::Create(StringPiece handle, StringPiece raw_text,
                                    int64 source_mtime,
                                    const Hasher* content_hasher) {
  return AssetIdentity(handle, content_hasher->RawHash(raw_text),
                       source_mtime);
}

GoogleString AssetIdentity::KeyMaterial() const {
  GoogleString mtime = Integer64ToString(source_mtime_);
  return StrCat(handle_.size(), ":", handle_, ",",
                content_hash_.size(), ":", content_hash_, ",",
                mtime.size(), ":", mtime);
}

}  // namespace assetspeed
