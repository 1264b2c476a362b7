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


#include <cstdio>
#include <cstdlib>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/file_message_handler.h"
#include "assetspeed/kernel/base/file_system.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/scoped_ptr.h"
#include "assetspeed/kernel/base/stdio_file_system.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/thread_system.h"
#include "assetspeed/kernel/cache/asset_cache.h"
#include "assetspeed/kernel/cache/cache_interface.h"
#include "assetspeed/kernel/cache/file_cache.h"
#include "assetspeed/kernel/cache/in_memory_cache.h"
#include "assetspeed/kernel/minify/asset_identity.h"
#include "assetspeed/kernel/minify/minify_options.h"
#include "assetspeed/kernel/minify/minify_pipeline.h"
#include "assetspeed/kernel/util/sha1_hasher.h"
#include "assetspeed/kernel/util/simple_stats.h"
#include "gflags/gflags.h"

// Command-line CSS and JavaScript minifier.  Takes a single file as either
// standard input or a command-line argument, minifies it through the asset
// cache and prints the result.  If minification falls back, the original
// text is printed.

namespace assetspeed {

DEFINE_string(cache_dir, "",
              "Directory holding minified assets.  Overrides FileCachePath "
              "from --config.  Without either, nothing is kept between runs.");
DEFINE_string(config, "",
              "File of 'Name value' option lines, e.g. 'MinifyJs off'.");
DEFINE_string(handle, "",
              "Name the asset is registered under.  Defaults to the input "
              "file name.");
DEFINE_string(language, "",
              "css or js.  Defaults to the input file's extension.");
DEFINE_string(url, "",
              "Url the asset is served from, for exclusion patterns.");
DEFINE_string(output, "-", "Where to write the result; - is stdout.");
DEFINE_bool(clear_cache, false,
            "Remove every cached asset before minifying.  With no input "
            "file, only clears.");
DEFINE_bool(print_stats, false,
            "Print statistics and cache usage to stderr when done.");

namespace {

const char kUsage[] =
    "Usage:\n"
    "  asset_minify [flags] foo.css\n"
    "  asset_minify --language=js --handle=foo [flags] < foo.js\n"
    "  asset_minify --cache_dir=/path --clear_cache\n";

bool ChooseLanguage(StringPiece filename, AssetLanguage* language) {
  if (!FLAGS_language.empty()) {
    if (StringCaseEqual(FLAGS_language, "css")) {
      *language = kCssLanguage;
    } else if (StringCaseEqual(FLAGS_language, "js")) {
      *language = kJsLanguage;
    } else {
      return false;
    }
    return true;
  }
  if (StringCaseEndsWith(filename, ".css")) {
    *language = kCssLanguage;
  } else if (StringCaseEndsWith(filename, ".js")) {
    *language = kJsLanguage;
  } else {
    return false;
  }
  return true;
}

bool ReadInput(StdioFileSystem* file_system, const char* filename,
               GoogleString* text, int64* mtime, MessageHandler* handler) {
  if (filename == NULL) {
    FileSystem::InputFile* input = file_system->Stdin();
    bool ret = input->ReadFile(text, FileSystem::kUnlimitedSize, handler);
    ret &= file_system->Close(input, handler);
    *mtime = 0;
    return ret;
  }
  return file_system->ReadFile(filename, text, handler) &&
      file_system->Mtime(filename, mtime, handler);
}

bool WriteOutput(StdioFileSystem* file_system, StringPiece text,
                 MessageHandler* handler) {
  if (FLAGS_output == "-") {
    FileSystem::OutputFile* output = file_system->Stdout();
    bool ret = output->Write(text, handler);
    ret &= file_system->Close(output, handler);
    return ret;
  }
  return file_system->WriteFile(FLAGS_output.c_str(), text, handler);
}

void PrintStats(const SimpleStats& stats, AssetCache* asset_cache) {
  GoogleString out;
  stats.Dump(&out);
  CacheUsage usage;
  if (asset_cache->Stats(&usage)) {
    StrAppend(&out, "cache_entries: ", Integer64ToString(usage.entry_count),
              "\ncache_bytes: ", Integer64ToString(usage.total_bytes), "\n");
  }
  fputs(out.c_str(), stderr);
}

bool AssetMinifyMain(int argc, char** argv) {
  FileMessageHandler handler(stderr);
  StdioFileSystem file_system;
  const char* filename = (argc == 2) ? argv[1] : NULL;
  if ((argc > 2) || ((filename == NULL) && FLAGS_handle.empty() &&
                     !FLAGS_clear_cache)) {
    handler.Message(kError, "%s", kUsage);
    return false;
  }

  MinifyOptions options;
  if (!FLAGS_config.empty() &&
      !options.LoadFromFile(&file_system, FLAGS_config.c_str(), &handler)) {
    return false;
  }
  if (!FLAGS_cache_dir.empty()) {
    options.set_file_cache_path(FLAGS_cache_dir);
  }

  scoped_ptr<ThreadSystem> thread_system(ThreadSystem::CreateThreadSystem());
  SimpleStats stats(thread_system.get());
  MinifyPipeline::InitStats(&stats);
  AssetCache::InitStats(&stats);
  FileCache::InitStats(&stats);

  Sha1Hasher hasher;
  scoped_ptr<CacheInterface> storage;
  if (options.file_cache_path().empty()) {
    storage.reset(new InMemoryCache(thread_system->NewMutex()));
  } else {
    storage.reset(new FileCache(options.file_cache_path(), &file_system,
                                &hasher, &stats, &handler));
  }
  MinifyPipeline pipeline(&options, &stats, &handler);
  AssetCache asset_cache(storage.get(), &pipeline, &hasher, &stats,
                         &handler);

  if (FLAGS_clear_cache) {
    if (!asset_cache.Clear()) {
      handler.Message(kError, "Failed to clear cache %s",
                      options.file_cache_path().c_str());
      return false;
    }
    if ((filename == NULL) && FLAGS_handle.empty()) {
      if (FLAGS_print_stats) {
        PrintStats(stats, &asset_cache);
      }
      return true;
    }
  }

  AssetLanguage language = kCssLanguage;
  if (!ChooseLanguage((filename == NULL) ? "" : filename, &language)) {
    handler.Message(kError, "Can not tell whether %s is css or js; "
                    "use --language", (filename == NULL) ? "<stdin>" : filename);
    return false;
  }

  GoogleString raw_text;
  int64 mtime = 0;
  if (!ReadInput(&file_system, filename, &raw_text, &mtime, &handler)) {
    return false;
  }
  GoogleString handle(FLAGS_handle.empty() ? filename : FLAGS_handle);

  MinifyRequest request(language, raw_text,
                        AssetIdentity::Create(handle, raw_text, mtime,
                                              &hasher));
  request.set_url(FLAGS_url);
  AssetCacheResult result;
  asset_cache.PutIfAbsent(request, &result);
  if (!result.cache_hit && !result.minified) {
    handler.Message(kWarning, "%s: served unminified: %s", handle.c_str(),
                    MinifyStatusName(result.status));
  }

  bool ret = WriteOutput(&file_system, result.output_text, &handler);
  if (FLAGS_print_stats) {
    PrintStats(stats, &asset_cache);
  }
  return ret;
}

}  // namespace

}  // namespace assetspeed

int main(int argc, char** argv) {
  gflags::SetUsageMessage(assetspeed::kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  return assetspeed::AssetMinifyMain(argc, argv) ? EXIT_SUCCESS
                                                 : EXIT_FAILURE;
}
