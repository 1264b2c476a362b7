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

#ifndef ASSETSPEED_KERNEL_BASE_FILE_SYSTEM_H_
#define ASSETSPEED_KERNEL_BASE_FILE_SYSTEM_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class MessageHandler;

// Three-way return type for distinguishing Errors from boolean answer.
//
// This is physically just an enum, but is wrapped in a class to prevent
// accidental usage in an if- or ternary-condition without explicitly
// indicating whether you are looking for true, false, or error.
class BoolOrError {
  enum Choice {
    kIsFalse,
    kIsTrue,
    kIsError
  };

 public:
  BoolOrError() : choice_(kIsError) { }
  explicit BoolOrError(bool t_or_f) : choice_(t_or_f ? kIsTrue : kIsFalse) { }

  // Intended to be passed by value; explicitly support copy & assign
  BoolOrError(const BoolOrError& src) : choice_(src.choice_) { }
  BoolOrError& operator=(const BoolOrError& src) {
    if (&src != this) {
      choice_ = src.choice_;
    }
    return *this;
  }

  bool is_false() const { return choice_ == kIsFalse; }
  bool is_true() const { return choice_ == kIsTrue; }
  bool is_error() const { return choice_ == kIsError; }
  void set_error() { choice_ = kIsError; }
  void set(bool t_or_f) { choice_ = t_or_f ? kIsTrue : kIsFalse; }

 private:
  Choice choice_;
};

// Provides abstract file system interface.  This isolation layer helps us:
//   - write unit tests that don't test the physical filesystem via a
//     test double
//   - keep the cache's publishing discipline (temp file, then rename) in
//     one place.
class FileSystem {
 public:
  // Passed as max_file_size to indicate there is no limit.
  static const int64 kUnlimitedSize = -1;

  virtual ~FileSystem();

  class File {
   public:
    virtual ~File();

    // Gets the name of the file.
    virtual const char* filename() = 0;

   protected:
    // Use public interface provided by FileSystem::Close.
    friend class FileSystem;
    virtual bool Close(MessageHandler* handler) = 0;
  };

  class InputFile : public File {
   public:
    // Reads the entire file into buf.  Returns false on a read error or if
    // the file is larger than max_file_size.
    virtual bool ReadFile(GoogleString* buf, int64 max_file_size,
                          MessageHandler* handler) = 0;

   protected:
    friend class FileSystem;
    ~InputFile() override;
  };

  class OutputFile : public File {
   public:
    // Note: Write is not atomic.  If Write fails, there is no indication of
    // how much data has already been written to the file.
    virtual bool Write(StringPiece buf, MessageHandler* handler) = 0;
    virtual bool Flush(MessageHandler* handler) = 0;
    virtual bool SetWorldReadable(MessageHandler* handler) = 0;

   protected:
    friend class FileSystem;
    ~OutputFile() override;
  };

  // High level support to read/write entire files in one shot.
  bool ReadFile(const char* filename, GoogleString* buffer,
                MessageHandler* handler);
  bool ReadFile(const char* filename, int64 max_file_size,
                GoogleString* buffer, MessageHandler* handler);
  bool WriteFile(const char* filename, StringPiece buffer,
                 MessageHandler* handler);
  // Writes given data to a new temporary file whose name starts with
  // prefix_name, and stores that name in *filename.  Returns false and
  // clears *filename on failure.
  bool WriteTempFile(StringPiece prefix_name, StringPiece buffer,
                     GoogleString* filename, MessageHandler* handler);

  // Writes buffer under filename so that concurrent readers see either the
  // previous contents or the complete new contents, never a partial file.
  // The data is written to a temp file next to filename and renamed into
  // place.
  bool WriteFileAtomic(StringPiece filename, StringPiece buffer,
                       MessageHandler* handler);

  // Returns NULL on failure; the caller owns the result and must pass it
  // to Close.
  virtual InputFile* OpenInputFile(const char* filename,
                                   MessageHandler* handler) = 0;
  virtual OutputFile* OpenOutputFile(const char* filename,
                                     MessageHandler* handler) = 0;
  // Opens a fresh, uniquely named file beginning with prefix_name.
  virtual OutputFile* OpenTempFile(StringPiece prefix_name,
                                   MessageHandler* handler) = 0;

  // Closes and deletes the file.
  bool Close(File* file, MessageHandler* handler);

  virtual bool RemoveFile(const char* filename, MessageHandler* handler) = 0;
  // Atomically replaces new_filename with old_filename.
  virtual bool RenameFile(const char* old_filename, const char* new_filename,
                          MessageHandler* handler) = 0;

  // Like POSIX 'mkdir', makes a directory only if parent directory exists.
  // Fails if directory_name already exists or parent directory doesn't exist.
  virtual bool MakeDir(const char* directory_path,
                       MessageHandler* handler) = 0;
  // Like POSIX 'rmdir', removes an empty directory.
  virtual bool RemoveDir(const char* directory_path,
                         MessageHandler* handler) = 0;

  // Like POSIX 'test -e', checks if path exists (is a file, directory, etc.).
  virtual BoolOrError Exists(const char* path, MessageHandler* handler) = 0;

  // Like POSIX 'test -d', checks if path exists and refers to a directory.
  virtual BoolOrError IsDir(const char* path, MessageHandler* handler) = 0;

  // Like POSIX 'mkdir -p', makes all directories up to this one recursively.
  // Fails if we do not have permission to make any directory in chain.
  bool RecursivelyMakeDir(StringPiece directory_path,
                          MessageHandler* handler);

  // Given a directory, lists the full paths of its immediate children.
  // Returns false if the directory could not be read.
  virtual bool ListContents(StringPiece dir, StringVector* files,
                            MessageHandler* handler) = 0;

  // Given a file, computes its last-modification time in seconds since the
  // epoch.
  virtual bool Mtime(StringPiece path, int64* timestamp_sec,
                     MessageHandler* handler) = 0;

  // Given a file, computes its size in bytes.
  virtual bool Size(StringPiece path, int64* size,
                    MessageHandler* handler) const = 0;

 protected:
  FileSystem() {}

 private:
  DISALLOW_COPY_AND_ASSIGN(FileSystem);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_FILE_SYSTEM_H_
