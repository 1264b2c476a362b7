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

#ifndef ASSETSPEED_KERNEL_BASE_STDIO_FILE_SYSTEM_H_
#define ASSETSPEED_KERNEL_BASE_STDIO_FILE_SYSTEM_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/file_system.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class MessageHandler;

// FileSystem implemented with stdio and POSIX calls.  "-" opens stdout
// for output.
class StdioFileSystem : public FileSystem {
 public:
  StdioFileSystem() {}
  ~StdioFileSystem() override;

  InputFile* OpenInputFile(const char* filename,
                           MessageHandler* message_handler) override;
  OutputFile* OpenOutputFile(const char* filename,
                             MessageHandler* message_handler) override;
  OutputFile* OpenTempFile(StringPiece prefix_name,
                           MessageHandler* message_handler) override;

  bool RemoveFile(const char* filename,
                  MessageHandler* message_handler) override;
  bool RenameFile(const char* old_filename, const char* new_filename,
                  MessageHandler* message_handler) override;

  bool MakeDir(const char* directory_path, MessageHandler* handler) override;
  bool RemoveDir(const char* directory_path, MessageHandler* handler) override;
  BoolOrError Exists(const char* path, MessageHandler* handler) override;
  BoolOrError IsDir(const char* path, MessageHandler* handler) override;

  bool ListContents(StringPiece dir, StringVector* files,
                    MessageHandler* handler) override;
  bool Mtime(StringPiece path, int64* timestamp_sec,
             MessageHandler* handler) override;
  bool Size(StringPiece path, int64* size,
            MessageHandler* handler) const override;

  InputFile* Stdin();
  OutputFile* Stdout();

 private:
  DISALLOW_COPY_AND_ASSIGN(StdioFileSystem);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_STDIO_FILE_SYSTEM_H_
