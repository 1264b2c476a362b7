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

#include "assetspeed/kernel/base/stdio_file_system.h"

#include <dirent.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/message_handler.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

namespace {

const int kReadChunkSize = 8192;

}  // namespace

// Helper class to factor out common implementation details between Input and
// Output files, in lieu of multiple inheritance.
class StdioFileHelper {
 public:
  StdioFileHelper(FILE* f, StringPiece filename)
      : file_(f),
        filename_(filename),
        line_(1) {
  }

  ~StdioFileHelper() {
    // Files must be closed through FileSystem::Close.  Close them here
    // anyway rather than leak the descriptor.
    if (file_ != NULL && file_ != stdout && file_ != stderr &&
        file_ != stdin) {
      fclose(file_);
    }
  }

  void CountNewlines(const char* buf, int size) {
    for (int i = 0; i < size; ++i, ++buf) {
      line_ += (*buf == '\n');
    }
  }

  void ReportError(MessageHandler* message_handler, const char* format) {
    message_handler->Error(filename_.c_str(), line_, format, strerror(errno));
  }

  bool Close(MessageHandler* message_handler) {
    bool ret = true;
    if (file_ != stdout && file_ != stderr && file_ != stdin) {
      if (fclose(file_) != 0) {
        ReportError(message_handler, "closing file: %s");
        ret = false;
      }
    } else if (file_ != stdin && fflush(file_) != 0) {
      ReportError(message_handler, "flushing file: %s");
      ret = false;
    }
    file_ = NULL;
    return ret;
  }

  FILE* file_;
  GoogleString filename_;
  int line_;

 private:
  DISALLOW_COPY_AND_ASSIGN(StdioFileHelper);
};

class StdioInputFile : public FileSystem::InputFile {
 public:
  StdioInputFile(FILE* f, StringPiece filename)
      : file_helper_(f, filename) {
  }

  bool ReadFile(GoogleString* buf, int64 max_file_size,
                MessageHandler* message_handler) override {
    buf->clear();
    char chunk[kReadChunkSize];
    for (;;) {
      size_t nread = fread(chunk, 1, sizeof(chunk), file_helper_.file_);
      if (nread > 0) {
        if ((max_file_size != FileSystem::kUnlimitedSize) &&
            (static_cast<int64>(buf->size() + nread) > max_file_size)) {
          message_handler->Error(
              file_helper_.filename_.c_str(), 0,
              "file exceeds maximum size of %lld bytes",
              static_cast<long long>(max_file_size));  // NOLINT
          buf->clear();
          return false;
        }
        file_helper_.CountNewlines(chunk, nread);
        buf->append(chunk, nread);
      }
      if (nread < sizeof(chunk)) {
        break;
      }
    }
    if (ferror(file_helper_.file_) != 0) {
      file_helper_.ReportError(message_handler, "reading file: %s");
      return false;
    }
    return true;
  }

  bool Close(MessageHandler* message_handler) override {
    return file_helper_.Close(message_handler);
  }

  const char* filename() override { return file_helper_.filename_.c_str(); }

 private:
  StdioFileHelper file_helper_;

  DISALLOW_COPY_AND_ASSIGN(StdioInputFile);
};

class StdioOutputFile : public FileSystem::OutputFile {
 public:
  StdioOutputFile(FILE* f, StringPiece filename)
      : file_helper_(f, filename) {
  }

  bool Write(StringPiece buf, MessageHandler* handler) override {
    size_t bytes_written =
        fwrite(buf.data(), 1, buf.size(), file_helper_.file_);
    file_helper_.CountNewlines(buf.data(), bytes_written);
    bool ret = (bytes_written == buf.size());
    if (!ret) {
      file_helper_.ReportError(handler, "writing file: %s");
    }
    return ret;
  }

  bool Flush(MessageHandler* message_handler) override {
    bool ret = true;
    if (fflush(file_helper_.file_) != 0) {
      file_helper_.ReportError(message_handler, "flushing file: %s");
      ret = false;
    }
    return ret;
  }

  bool Close(MessageHandler* message_handler) override {
    return file_helper_.Close(message_handler);
  }

  const char* filename() override { return file_helper_.filename_.c_str(); }

  bool SetWorldReadable(MessageHandler* message_handler) override {
    bool ret = true;
    int fd = fileno(file_helper_.file_);
    int status = fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (status != 0) {
      ret = false;
      file_helper_.ReportError(message_handler, "setting world-readable: %s");
    }
    return ret;
  }

 private:
  StdioFileHelper file_helper_;

  DISALLOW_COPY_AND_ASSIGN(StdioOutputFile);
};

StdioFileSystem::~StdioFileSystem() {
}

FileSystem::InputFile* StdioFileSystem::OpenInputFile(
    const char* filename, MessageHandler* message_handler) {
  FileSystem::InputFile* input_file = NULL;
  FILE* f = fopen(filename, "r");
  if (f == NULL) {
    message_handler->Error(filename, 0, "opening input file: %s",
                           strerror(errno));
  } else {
    input_file = new StdioInputFile(f, filename);
  }
  return input_file;
}

FileSystem::OutputFile* StdioFileSystem::OpenOutputFile(
    const char* filename, MessageHandler* message_handler) {
  FileSystem::OutputFile* output_file = NULL;
  if (strcmp(filename, "-") == 0) {
    output_file = new StdioOutputFile(stdout, "<stdout>");
  } else {
    FILE* f = fopen(filename, "w");
    if (f == NULL) {
      message_handler->Error(filename, 0,
                             "opening output file: %s", strerror(errno));
    } else {
      output_file = new StdioOutputFile(f, filename);
    }
  }
  return output_file;
}

FileSystem::OutputFile* StdioFileSystem::OpenTempFile(
    StringPiece prefix, MessageHandler* message_handler) {
  GoogleString template_name = StrCat(prefix, "XXXXXX");
  int fd = mkstemp(&template_name[0]);
  OutputFile* output_file = NULL;
  if (fd < 0) {
    message_handler->Error(template_name.c_str(), 0,
                           "opening temp file: %s", strerror(errno));
  } else {
    FILE* f = fdopen(fd, "w");
    if (f == NULL) {
      close(fd);
      message_handler->Error(template_name.c_str(), 0,
                             "re-opening temp file: %s", strerror(errno));
      unlink(template_name.c_str());
    } else {
      output_file = new StdioOutputFile(f, template_name);
    }
  }
  return output_file;
}

bool StdioFileSystem::RemoveFile(const char* filename,
                                 MessageHandler* handler) {
  bool ret = (remove(filename) == 0);
  if (!ret) {
    handler->Message(kError, "Failed to delete file %s: %s",
                     filename, strerror(errno));
  }
  return ret;
}

bool StdioFileSystem::RenameFile(const char* old_file, const char* new_file,
                                 MessageHandler* handler) {
  bool ret = (rename(old_file, new_file) == 0);
  if (!ret) {
    handler->Message(kError, "Failed to rename file %s to %s: %s",
                     old_file, new_file, strerror(errno));
  }
  return ret;
}

bool StdioFileSystem::MakeDir(const char* path, MessageHandler* handler) {
  // Mode 0777 makes the file use standard umask permissions.
  bool ret = (mkdir(path, 0777) == 0);
  if (!ret) {
    handler->Message(kError, "Failed to make directory %s: %s",
                     path, strerror(errno));
  }
  return ret;
}

bool StdioFileSystem::RemoveDir(const char* path, MessageHandler* handler) {
  bool ret = (rmdir(path) == 0);
  if (!ret) {
    handler->Message(kError, "Failed to remove directory %s: %s",
                     path, strerror(errno));
  }
  return ret;
}

BoolOrError StdioFileSystem::Exists(const char* path, MessageHandler* handler) {
  struct stat statbuf;
  BoolOrError ret(stat(path, &statbuf) == 0);
  if (ret.is_false() && errno != ENOENT) {  // Not error if file doesn't exist.
    handler->Message(kError, "Failed to stat %s: %s",
                     path, strerror(errno));
    ret.set_error();
  }
  return ret;
}

BoolOrError StdioFileSystem::IsDir(const char* path, MessageHandler* handler) {
  struct stat statbuf;
  BoolOrError ret(false);
  if (stat(path, &statbuf) == 0) {
    ret.set(S_ISDIR(statbuf.st_mode));
  } else if (errno != ENOENT) {  // Not an error if file doesn't exist.
    handler->Message(kError, "Failed to stat %s: %s",
                     path, strerror(errno));
    ret.set_error();
  }
  return ret;
}

bool StdioFileSystem::ListContents(StringPiece dir, StringVector* files,
                                   MessageHandler* handler) {
  GoogleString dir_string(dir);
  EnsureEndsInSlash(&dir_string);
  const char* dirname = dir_string.c_str();
  DIR* mydir = opendir(dirname);
  if (mydir == NULL) {
    handler->Error(dirname, 0, "Failed to opendir: %s", strerror(errno));
    return false;
  }
  dirent* entry;
  while ((entry = readdir(mydir)) != NULL) {
    if ((strcmp(entry->d_name, ".") != 0) &&
        (strcmp(entry->d_name, "..") != 0)) {
      files->push_back(dir_string + entry->d_name);
    }
  }
  if (closedir(mydir) != 0) {
    handler->Error(dirname, 0, "Failed to closedir: %s", strerror(errno));
    return false;
  }
  return true;
}

bool StdioFileSystem::Mtime(StringPiece path, int64* timestamp_sec,
                            MessageHandler* handler) {
  const GoogleString path_string(path);
  const char* path_str = path_string.c_str();
  struct stat statbuf;
  if (stat(path_str, &statbuf) == 0) {
    *timestamp_sec = statbuf.st_mtime;
    return true;
  }
  handler->Message(kError, "Failed to stat %s: %s",
                   path_str, strerror(errno));
  return false;
}

bool StdioFileSystem::Size(StringPiece path, int64* size,
                           MessageHandler* handler) const {
  const GoogleString path_string(path);
  const char* path_str = path_string.c_str();
  struct stat statbuf;
  if (stat(path_str, &statbuf) == 0) {
    *size = statbuf.st_size;
    return true;
  }
  handler->Message(kError, "Failed to stat %s: %s",
                   path_str, strerror(errno));
  return false;
}

FileSystem::InputFile* StdioFileSystem::Stdin() {
  return new StdioInputFile(stdin, "stdin");
}

FileSystem::OutputFile* StdioFileSystem::Stdout() {
  return new StdioOutputFile(stdout, "stdout");
}

}  // namespace assetspeed
