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


#include "assetspeed/kernel/minify/minify_status.h"

namespace assetspeed {

const char* MinifyStatusName(MinifyStatus status) {
  switch (status) {
    case kMinifyOk:
      return "ok";
    case kMalformedInput:
      return "malformed input";
    case kSizeLimitExceeded:
      return "size limit exceeded";
    case kExcludedAsset:
      return "excluded asset";
    case kPlaceholderConflict:
      return "placeholder conflict";
    case kLanguageDisabled:
      return "language disabled";
    case kAlreadyMinified:
      return "already minified";
  }
  return "unknown";
}

const char* AssetLanguageName(AssetLanguage language) {
  switch (language) {
    case kCssLanguage:
      return "css";
    case kJsLanguage:
      return "js";
  }
  return "unknown";
}

}  // namespace assetspeed
