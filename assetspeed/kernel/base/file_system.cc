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

#include "assetspeed/kernel/base/file_system.h"

#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

FileSystem::~FileSystem() {
}

FileSystem::File::~File() {
}

FileSystem::InputFile::~InputFile() {
}

FileSystem::OutputFile::~OutputFile() {
}

bool FileSystem::ReadFile(const char* filename, GoogleString* buffer,
                          MessageHandler* message_handler) {
  return ReadFile(filename, kUnlimitedSize, buffer, message_handler);
}

bool FileSystem::ReadFile(const char* filename, int64 max_file_size,
                          GoogleString* buffer,
                          MessageHandler* message_handler) {
  InputFile* input_file = OpenInputFile(filename, message_handler);
  bool ret = false;
  if (input_file != NULL) {
    ret = input_file->ReadFile(buffer, max_file_size, message_handler);
    ret &= Close(input_file, message_handler);
  }
  return ret;
}

bool FileSystem::WriteFile(const char* filename, StringPiece buffer,
                           MessageHandler* message_handler) {
  OutputFile* output_file = OpenOutputFile(filename, message_handler);
  bool ret = false;
  if (output_file != NULL) {
    ret = output_file->Write(buffer, message_handler);
    ret &= output_file->SetWorldReadable(message_handler);
    ret &= Close(output_file, message_handler);
  }
  return ret;
}

bool FileSystem::WriteTempFile(StringPiece prefix_name, StringPiece buffer,
                               GoogleString* filename,
                               MessageHandler* message_handler) {
  OutputFile* output_file = OpenTempFile(prefix_name, message_handler);
  bool ok = (output_file != NULL);
  if (ok) {
    // Store filename early, since it's invalidated by Close.
    *filename = output_file->filename();
    ok = output_file->Write(buffer, message_handler);
    ok &= output_file->SetWorldReadable(message_handler);
    // attempt Close even if write fails.
    ok &= Close(output_file, message_handler);
  }
  if (!ok) {
    if (!filename->empty()) {
      RemoveFile(filename->c_str(), message_handler);
    }
    // Clear filename so we end in a consistent state.
    filename->clear();
  }
  return ok;
}

bool FileSystem::WriteFileAtomic(StringPiece filename, StringPiece buffer,
                                 MessageHandler* message_handler) {
  // The temp file lives in the same directory so the rename cannot cross
  // devices, and is hidden so directory scans skip it.
  GoogleString prefix;
  size_t last_slash = filename.rfind('/');
  if (last_slash == StringPiece::npos) {
    prefix = StrCat(".", filename, ".");
  } else {
    prefix = StrCat(filename.substr(0, last_slash + 1), ".",
                    filename.substr(last_slash + 1), ".");
  }
  GoogleString temp_filename;
  if (!WriteTempFile(prefix, buffer, &temp_filename, message_handler)) {
    return false;
  }
  GoogleString final_filename(filename);
  if (!RenameFile(temp_filename.c_str(), final_filename.c_str(),
                  message_handler)) {
    RemoveFile(temp_filename.c_str(), message_handler);
    return false;
  }
  return true;
}

bool FileSystem::Close(File* file, MessageHandler* message_handler) {
  bool ret = file->Close(message_handler);
  delete file;
  return ret;
}

bool FileSystem::RecursivelyMakeDir(StringPiece full_path_const,
                                    MessageHandler* handler) {
  bool ret = true;
  GoogleString full_path(full_path_const);
  EnsureEndsInSlash(&full_path);
  GoogleString subpath;
  subpath.reserve(full_path.size());
  size_t old_pos = 0, new_pos;
  // Note that we intentionally start searching at pos = 1 to avoid having
  // subpath be "" on absolute paths.
  while ((new_pos = full_path.find('/', old_pos + 1)) != GoogleString::npos) {
    // Build up path, one segment at a time.
    subpath.append(full_path.data() + old_pos, new_pos - old_pos);
    if (Exists(subpath.c_str(), handler).is_false()) {
      // Another process may create the same directory between the
      // Exists check and MakeDir, so re-check before failing.
      if (!MakeDir(subpath.c_str(), handler) &&
          !IsDir(subpath.c_str(), handler).is_true()) {
        ret = false;
        break;
      }
    } else if (IsDir(subpath.c_str(), handler).is_false()) {
      handler->Message(kError, "Subpath '%s' of '%s' is a non-directory file.",
                       subpath.c_str(), full_path.c_str());
      ret = false;
      break;
    }
    old_pos = new_pos;
  }
  return ret;
}

}  // namespace assetspeed
