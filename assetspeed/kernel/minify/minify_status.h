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


#ifndef ASSETSPEED_KERNEL_MINIFY_MINIFY_STATUS_H_
#define ASSETSPEED_KERNEL_MINIFY_MINIFY_STATUS_H_

namespace assetspeed {

enum AssetLanguage {
  kCssLanguage,
  kJsLanguage
};

// Outcome of a minification attempt.  Anything other than kMinifyOk means
// the original text is served unchanged.
enum MinifyStatus {
  kMinifyOk,
  // A string, template, regex, comment, url( or calc( was not closed.
  kMalformedInput,
  kSizeLimitExceeded,
  kExcludedAsset,
  // The input already contains text of placeholder form.
  kPlaceholderConflict,
  kLanguageDisabled,
  kAlreadyMinified
};

const char* MinifyStatusName(MinifyStatus status);
const char* AssetLanguageName(AssetLanguage language);

// Guard fallbacks are decided before any stage runs; they depend on the
// configuration rather than on the text.
inline bool IsGuardStatus(MinifyStatus status) {
  return (status == kSizeLimitExceeded) || (status == kExcludedAsset) ||
      (status == kLanguageDisabled) || (status == kAlreadyMinified);
}

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_MINIFY_MINIFY_STATUS_H_
