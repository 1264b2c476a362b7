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


#include "assetspeed/kernel/minify/minify_options.h"

#include "assetspeed/kernel/base/file_system.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

const char MinifyOptions::kMaxInputBytes[] = "MaxInputBytes";
const char MinifyOptions::kMinifyCss[] = "MinifyCss";
const char MinifyOptions::kMinifyJs[] = "MinifyJs";
const char MinifyOptions::kSkipMinifiedAssets[] = "SkipMinifiedAssets";
const char MinifyOptions::kExclude[] = "Exclude";
const char MinifyOptions::kCssStripLeadingZero[] = "CssStripLeadingZero";
const char MinifyOptions::kCssStripNegativeLeadingZero[] =
    "CssStripNegativeLeadingZero";
const char MinifyOptions::kCssZeroUnits[] = "CssZeroUnits";
const char MinifyOptions::kCssCompressHexColors[] = "CssCompressHexColors";
const char MinifyOptions::kJsShortenBooleans[] = "JsShortenBooleans";
const char MinifyOptions::kJsDotNotation[] = "JsDotNotation";
const char MinifyOptions::kFileCachePath[] = "FileCachePath";

const int64 MinifyOptions::kDefaultMaxInputBytes = 1024 * 1024;
const char MinifyOptions::kDefaultCssZeroUnits[] =
    "px,em,rem,ex,ch,vw,vh,vmin,vmax,cm,mm,in,pt,pc,q";

namespace {

// Units where 0<unit> and a bare 0 are not interchangeable: either 0 is
// not a valid value of that type, or the unit is not a length at all.
const char* const kNeverStrippedUnits[] = {
  "s", "ms", "deg", "rad", "grad", "turn", "hz", "khz", "dpi", "dpcm",
  "dppx", "x", "fr"
};

template <class OptionsT>
MinifyOptions::OptionSettingResult ParseAndSetOptionHelper(
    StringPiece option_value, OptionsT* options,
    void (OptionsT::*set_option_method)(bool), GoogleString* msg) {
  bool parsed_value;
  if (!MinifyOptions::ParseFromString(option_value, &parsed_value)) {
    *msg = "expected on or off";
    return MinifyOptions::kOptionValueInvalid;
  }
  (options->*set_option_method)(parsed_value);
  return MinifyOptions::kOptionOk;
}

}  // namespace

MinifyOptions::MinifyOptions()
    : max_input_bytes_(kDefaultMaxInputBytes),
      minify_css_(true),
      minify_js_(true),
      skip_minified_assets_(true),
      css_strip_leading_zero_(true),
      css_strip_negative_leading_zero_(false),
      css_compress_hex_colors_(true),
      js_shorten_booleans_(true),
      js_dot_notation_(true) {
  GoogleString unused;
  SetCssZeroUnits(kDefaultCssZeroUnits, &unused);
}

MinifyOptions::~MinifyOptions() {
}

bool MinifyOptions::ParseFromString(StringPiece value_string, bool* value) {
  if (StringCaseEqual(value_string, "true") ||
      StringCaseEqual(value_string, "on")) {
    *value = true;
  } else if (StringCaseEqual(value_string, "false") ||
             StringCaseEqual(value_string, "off")) {
    *value = false;
  } else {
    return false;
  }
  return true;
}

MinifyOptions::OptionSettingResult MinifyOptions::SetOptionFromName(
    StringPiece name, StringPiece value, GoogleString* msg) {
  if (StringCaseEqual(name, kMaxInputBytes)) {
    int64 max_bytes;
    if (!StringToInt64(value, &max_bytes) || (max_bytes <= 0)) {
      *msg = "expected a positive number of bytes";
      return kOptionValueInvalid;
    }
    set_max_input_bytes(max_bytes);
  } else if (StringCaseEqual(name, kMinifyCss)) {
    return ParseAndSetOptionHelper<MinifyOptions>(
        value, this, &MinifyOptions::set_minify_css, msg);
  } else if (StringCaseEqual(name, kMinifyJs)) {
    return ParseAndSetOptionHelper<MinifyOptions>(
        value, this, &MinifyOptions::set_minify_js, msg);
  } else if (StringCaseEqual(name, kSkipMinifiedAssets)) {
    return ParseAndSetOptionHelper<MinifyOptions>(
        value, this, &MinifyOptions::set_skip_minified_assets, msg);
  } else if (StringCaseEqual(name, kExclude)) {
    if (value.empty()) {
      *msg = "expected a handle or url pattern";
      return kOptionValueInvalid;
    }
    Exclude(value);
  } else if (StringCaseEqual(name, kCssStripLeadingZero)) {
    return ParseAndSetOptionHelper<MinifyOptions>(
        value, this, &MinifyOptions::set_css_strip_leading_zero, msg);
  } else if (StringCaseEqual(name, kCssStripNegativeLeadingZero)) {
    return ParseAndSetOptionHelper<MinifyOptions>(
        value, this, &MinifyOptions::set_css_strip_negative_leading_zero,
        msg);
  } else if (StringCaseEqual(name, kCssZeroUnits)) {
    if (!SetCssZeroUnits(value, msg)) {
      return kOptionValueInvalid;
    }
  } else if (StringCaseEqual(name, kCssCompressHexColors)) {
    return ParseAndSetOptionHelper<MinifyOptions>(
        value, this, &MinifyOptions::set_css_compress_hex_colors, msg);
  } else if (StringCaseEqual(name, kJsShortenBooleans)) {
    return ParseAndSetOptionHelper<MinifyOptions>(
        value, this, &MinifyOptions::set_js_shorten_booleans, msg);
  } else if (StringCaseEqual(name, kJsDotNotation)) {
    return ParseAndSetOptionHelper<MinifyOptions>(
        value, this, &MinifyOptions::set_js_dot_notation, msg);
  } else if (StringCaseEqual(name, kFileCachePath)) {
    if (!HasPrefixString(value, "/")) {
      *msg = "must start with a slash";
      return kOptionValueInvalid;
    }
    set_file_cache_path(value);
  } else {
    return kOptionNameUnknown;
  }
  return kOptionOk;
}

bool MinifyOptions::LoadFromFile(FileSystem* file_system,
                                 const char* filename,
                                 MessageHandler* handler) {
  GoogleString contents;
  if (!file_system->ReadFile(filename, &contents, handler)) {
    return false;
  }
  bool ret = true;
  StringPieceVector lines;
  SplitStringPieceToVector(contents, "\n", &lines, false);
  for (int i = 0, n = lines.size(); i < n; ++i) {
    StringPiece line = lines[i];
    TrimWhitespace(&line);
    if (line.empty() || (line[0] == '#')) {
      continue;
    }
    size_t space = line.find_first_of(" \t");
    StringPiece name = line.substr(0, space);
    StringPiece value;
    if (space != StringPiece::npos) {
      value = line.substr(space);
      TrimWhitespace(&value);
    }
    GoogleString msg;
    switch (SetOptionFromName(name, value, &msg)) {
      case kOptionOk:
        break;
      case kOptionNameUnknown:
        handler->Error(filename, i + 1, "Unknown option \"%s\"",
                       GoogleString(name).c_str());
        ret = false;
        break;
      case kOptionValueInvalid:
        handler->Error(filename, i + 1, "Invalid value \"%s\" for %s: %s",
                       GoogleString(value).c_str(),
                       GoogleString(name).c_str(), msg.c_str());
        ret = false;
        break;
    }
  }
  return ret;
}

bool MinifyOptions::SetCssZeroUnits(StringPiece unit_list,
                                    GoogleString* msg) {
  StringPieceVector units;
  SplitStringPieceToVector(unit_list, ", \t", &units, true);
  StringSet new_units;
  for (int i = 0, n = units.size(); i < n; ++i) {
    GoogleString unit(units[i]);
    LowerString(&unit);
    for (size_t c = 0; c < unit.size(); ++c) {
      if (!IsAsciiAlpha(unit[c])) {
        *msg = StrCat("\"", unit, "\" is not a length unit");
        return false;
      }
    }
    for (size_t k = 0; k < arraysize(kNeverStrippedUnits); ++k) {
      if (unit == kNeverStrippedUnits[k]) {
        *msg = StrCat("0", unit, " is not equivalent to 0");
        return false;
      }
    }
    new_units.insert(unit);
  }
  css_zero_units_.swap(new_units);
  return true;
}

bool MinifyOptions::IsZeroStrippableUnit(StringPiece unit) const {
  GoogleString lower(unit);
  LowerString(&lower);
  return css_zero_units_.find(lower) != css_zero_units_.end();
}

bool MinifyOptions::IsExcluded(StringPiece handle, StringPiece url) const {
  if (exclusions_.empty()) {
    return false;
  }
  return (!handle.empty() && exclusions_.Match(handle, false)) ||
      (!url.empty() && exclusions_.MatchOrContains(url, false));
}

void MinifyOptions::CopyFrom(const MinifyOptions& src) {
  max_input_bytes_ = src.max_input_bytes_;
  minify_css_ = src.minify_css_;
  minify_js_ = src.minify_js_;
  skip_minified_assets_ = src.skip_minified_assets_;
  css_strip_leading_zero_ = src.css_strip_leading_zero_;
  css_strip_negative_leading_zero_ = src.css_strip_negative_leading_zero_;
  css_compress_hex_colors_ = src.css_compress_hex_colors_;
  js_shorten_booleans_ = src.js_shorten_booleans_;
  js_dot_notation_ = src.js_dot_notation_;
  file_cache_path_ = src.file_cache_path_;
  css_zero_units_ = src.css_zero_units_;
  exclusions_.CopyFrom(src.exclusions_);
}

}  // namespace assetspeed
