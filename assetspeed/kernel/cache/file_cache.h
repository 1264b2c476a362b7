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


#ifndef ASSETSPEED_KERNEL_CACHE_FILE_CACHE_H_
#define ASSETSPEED_KERNEL_CACHE_FILE_CACHE_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/cache/cache_interface.h"

namespace assetspeed {

class FileSystem;
class Hasher;
class MessageHandler;
class Statistics;
class Variable;

// Stores each entry in its own file under one directory, named by the
// hash of its key.  Writes go to a hidden temp file in the same directory
// which is then renamed into place, so a concurrent reader sees either no
// entry or a complete one.  Safe to share between threads and processes
// as far as the file system's rename is atomic.
class FileCache : public CacheInterface {
 public:
  // The hasher names the entry files.  file_system, hasher, stats and
  // handler must outlive the cache.
  FileCache(const GoogleString& path, FileSystem* file_system,
            const Hasher* hasher, Statistics* stats,
            MessageHandler* handler);
  ~FileCache() override;

  static void InitStats(Statistics* statistics);

  void Get(const GoogleString& key, Callback* callback) override;
  bool Put(const GoogleString& key, StringPiece value) override;
  void Delete(const GoogleString& key) override;
  bool Clear() override;
  bool GetUsage(CacheUsage* usage) override;

  static GoogleString FormatName() { return "FileCache"; }
  GoogleString Name() const override { return FormatName(); }

  bool IsBlocking() const override { return true; }
  bool IsHealthy() const override { return true; }
  void ShutDown() override {}

  const GoogleString& path() const { return path_; }

  // The file an entry for key is stored in.
  GoogleString EntryFilename(const GoogleString& key) const;

  // Variable names.
  static const char kWrites[];
  static const char kWriteErrors[];
  static const char kReadErrors[];

 private:
  // Whether a name listed in the cache directory is a published entry,
  // rather than an in-flight temp file.
  static bool IsEntryFile(StringPiece filename);

  // Lists the published entries.  A missing directory has none.
  bool ListEntries(StringVector* entries);

  GoogleString path_;
  FileSystem* file_system_;
  const Hasher* hasher_;
  MessageHandler* message_handler_;

  Variable* writes_;
  Variable* write_errors_;
  Variable* read_errors_;

  DISALLOW_COPY_AND_ASSIGN(FileCache);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_CACHE_FILE_CACHE_H_
