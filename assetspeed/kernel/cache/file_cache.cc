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


#include "assetspeed/kernel/cache/file_cache.h"

#include "assetspeed/kernel/base/file_system.h"
#include "assetspeed/kernel/base/hasher.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/null_message_handler.h"
#include "assetspeed/kernel/base/statistics.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

const char FileCache::kWrites[] = "file_cache_writes";
const char FileCache::kWriteErrors[] = "file_cache_write_errors";
const char FileCache::kReadErrors[] = "file_cache_read_errors";

FileCache::FileCache(const GoogleString& path, FileSystem* file_system,
                     const Hasher* hasher, Statistics* stats,
                     MessageHandler* handler)
    : path_(path),
      file_system_(file_system),
      hasher_(hasher),
      message_handler_(handler),
      writes_(stats->GetVariable(kWrites)),
      write_errors_(stats->GetVariable(kWriteErrors)),
      read_errors_(stats->GetVariable(kReadErrors)) {
  EnsureEndsInSlash(&path_);
}

FileCache::~FileCache() {
}

void FileCache::InitStats(Statistics* statistics) {
  statistics->AddVariable(kWrites);
  statistics->AddVariable(kWriteErrors);
  statistics->AddVariable(kReadErrors);
}

GoogleString FileCache::EntryFilename(const GoogleString& key) const {
  return StrCat(path_, hasher_->Hash(key));
}

bool FileCache::IsEntryFile(StringPiece filename) {
  size_t last_slash = filename.rfind('/');
  StringPiece base = (last_slash == StringPiece::npos)
      ? filename : filename.substr(last_slash + 1);
  return !base.empty() && (base[0] != '.');
}

void FileCache::Get(const GoogleString& key, Callback* callback) {
  GoogleString filename = EntryFilename(key);
  // Suppress read errors.  A missing file is the common case of a miss,
  // which is not worth a message.
  NullMessageHandler null_handler;
  GoogleString buf;
  KeyState state = kNotFound;
  if (file_system_->ReadFile(filename.c_str(), &buf, &null_handler)) {
    callback->mutable_value()->swap(buf);
    state = kAvailable;
  } else if (file_system_->Exists(filename.c_str(),
                                  &null_handler).is_true()) {
    // The entry is there but could not be read.
    read_errors_->Add(1);
    message_handler_->Message(kWarning, "Failed to read cache entry %s",
                              filename.c_str());
    state = kReadError;
  }
  ValidateAndReportResult(key, state, callback);
}

bool FileCache::Put(const GoogleString& key, StringPiece value) {
  GoogleString filename = EntryFilename(key);
  bool ok = file_system_->RecursivelyMakeDir(path_, message_handler_) &&
      file_system_->WriteFileAtomic(filename, value, message_handler_);
  if (ok) {
    writes_->Add(1);
  } else {
    write_errors_->Add(1);
  }
  return ok;
}

void FileCache::Delete(const GoogleString& key) {
  GoogleString filename = EntryFilename(key);
  NullMessageHandler null_handler;  // Do not emit messages on delete failures.
  file_system_->RemoveFile(filename.c_str(), &null_handler);
}

bool FileCache::ListEntries(StringVector* entries) {
  BoolOrError exists = file_system_->Exists(path_.c_str(), message_handler_);
  if (exists.is_false()) {
    return true;
  } else if (exists.is_error()) {
    return false;
  }
  StringVector files;
  if (!file_system_->ListContents(path_, &files, message_handler_)) {
    return false;
  }
  for (int i = 0, n = files.size(); i < n; ++i) {
    if (IsEntryFile(files[i])) {
      entries->push_back(files[i]);
    }
  }
  return true;
}

bool FileCache::Clear() {
  StringVector entries;
  if (!ListEntries(&entries)) {
    return false;
  }
  bool ret = true;
  for (int i = 0, n = entries.size(); i < n; ++i) {
    ret &= file_system_->RemoveFile(entries[i].c_str(), message_handler_);
  }
  return ret;
}

bool FileCache::GetUsage(CacheUsage* usage) {
  usage->entry_count = 0;
  usage->total_bytes = 0;
  StringVector entries;
  if (!ListEntries(&entries)) {
    return false;
  }
  bool ret = true;
  for (int i = 0, n = entries.size(); i < n; ++i) {
    int64 size = 0;
    // An entry deleted since the listing is simply not counted.
    NullMessageHandler null_handler;
    if (file_system_->Size(entries[i], &size, &null_handler)) {
      ++usage->entry_count;
      usage->total_bytes += size;
    } else if (file_system_->Exists(entries[i].c_str(),
                                    &null_handler).is_true()) {
      ret = false;
    }
  }
  return ret;
}

}  // namespace assetspeed
