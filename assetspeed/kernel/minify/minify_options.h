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


#ifndef ASSETSPEED_KERNEL_MINIFY_MINIFY_OPTIONS_H_
#define ASSETSPEED_KERNEL_MINIFY_MINIFY_OPTIONS_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/util/wildcard_group.h"

namespace assetspeed {

class FileSystem;
class MessageHandler;

// Settings for minification and the asset cache.  Options are set either
// through the typed setters or by name, as read from a directive file:
//
//   # comment
//   MaxInputBytes 524288
//   MinifyJs off
//   Exclude jquery-*
//   CssZeroUnits px,em,rem
class MinifyOptions {
 public:
  enum OptionSettingResult {
    kOptionOk,
    kOptionNameUnknown,
    kOptionValueInvalid
  };

  // Option names, as used in directive files.
  static const char kMaxInputBytes[];
  static const char kMinifyCss[];
  static const char kMinifyJs[];
  static const char kSkipMinifiedAssets[];
  static const char kExclude[];
  static const char kCssStripLeadingZero[];
  static const char kCssStripNegativeLeadingZero[];
  static const char kCssZeroUnits[];
  static const char kCssCompressHexColors[];
  static const char kJsShortenBooleans[];
  static const char kJsDotNotation[];
  static const char kFileCachePath[];

  static const int64 kDefaultMaxInputBytes;
  static const char kDefaultCssZeroUnits[];

  MinifyOptions();
  ~MinifyOptions();

  // Sets the option called name (case-insensitive) from its string form.
  // On kOptionValueInvalid, *msg says what was wrong with value.
  OptionSettingResult SetOptionFromName(StringPiece name, StringPiece value,
                                        GoogleString* msg);

  // Applies every "Name value" line of a directive file.  Blank lines and
  // lines starting with '#' are ignored.  Bad lines are reported through
  // handler with their line number and skipped; returns false if the file
  // could not be read or any line was bad.
  bool LoadFromFile(FileSystem* file_system, const char* filename,
                    MessageHandler* handler);

  // Parses "true"/"on" and "false"/"off", case-insensitively.
  static bool ParseFromString(StringPiece value_string, bool* value);

  int64 max_input_bytes() const { return max_input_bytes_; }
  void set_max_input_bytes(int64 x) { max_input_bytes_ = x; }

  bool minify_css() const { return minify_css_; }
  void set_minify_css(bool x) { minify_css_ = x; }

  bool minify_js() const { return minify_js_; }
  void set_minify_js(bool x) { minify_js_ = x; }

  bool skip_minified_assets() const { return skip_minified_assets_; }
  void set_skip_minified_assets(bool x) { skip_minified_assets_ = x; }

  bool css_strip_leading_zero() const { return css_strip_leading_zero_; }
  void set_css_strip_leading_zero(bool x) { css_strip_leading_zero_ = x; }

  bool css_strip_negative_leading_zero() const {
    return css_strip_negative_leading_zero_;
  }
  void set_css_strip_negative_leading_zero(bool x) {
    css_strip_negative_leading_zero_ = x;
  }

  bool css_compress_hex_colors() const { return css_compress_hex_colors_; }
  void set_css_compress_hex_colors(bool x) { css_compress_hex_colors_ = x; }

  bool js_shorten_booleans() const { return js_shorten_booleans_; }
  void set_js_shorten_booleans(bool x) { js_shorten_booleans_ = x; }

  bool js_dot_notation() const { return js_dot_notation_; }
  void set_js_dot_notation(bool x) { js_dot_notation_ = x; }

  const GoogleString& file_cache_path() const { return file_cache_path_; }
  void set_file_cache_path(StringPiece x) {
    file_cache_path_.assign(x.data(), x.size());
  }

  // Units for which 0<unit> may be written as a bare 0, lower case.
  const StringSet& css_zero_units() const { return css_zero_units_; }
  // Replaces the unit allow-list from a comma or space separated list.
  // Units whose zero is not interchangeable with a bare 0 (percentages,
  // times, angles, frequencies, resolutions) are rejected, leaving the
  // list unchanged.
  bool SetCssZeroUnits(StringPiece unit_list, GoogleString* msg);
  bool IsZeroStrippableUnit(StringPiece unit) const;

  // Adds a handle or url glob to the exclusion list.
  void Exclude(StringPiece pattern) { exclusions_.Allow(pattern); }
  // Whether a handle or url is excluded.  Handles must match a pattern
  // entirely.  A url may also contain a pattern that has no wildcards.
  bool IsExcluded(StringPiece handle, StringPiece url) const;
  const WildcardGroup& exclusions() const { return exclusions_; }

  void CopyFrom(const MinifyOptions& src);

 private:
  int64 max_input_bytes_;
  bool minify_css_;
  bool minify_js_;
  bool skip_minified_assets_;
  bool css_strip_leading_zero_;
  bool css_strip_negative_leading_zero_;
  bool css_compress_hex_colors_;
  bool js_shorten_booleans_;
  bool js_dot_notation_;
  GoogleString file_cache_path_;
  StringSet css_zero_units_;
  WildcardGroup exclusions_;

  DISALLOW_COPY_AND_ASSIGN(MinifyOptions);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_MINIFY_MINIFY_OPTIONS_H_
