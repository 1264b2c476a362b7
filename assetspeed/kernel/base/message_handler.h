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

#ifndef ASSETSPEED_KERNEL_BASE_MESSAGE_HANDLER_H_
#define ASSETSPEED_KERNEL_BASE_MESSAGE_HANDLER_H_

#include <cstdarg>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/printf_format.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

enum MessageType {
  kInfo,
  kWarning,
  kError,
  kFatal
};

class MessageHandler {
 public:
  MessageHandler();
  virtual ~MessageHandler();

  // String representation for MessageType.
  const char* MessageTypeToString(const MessageType type) const;

  // Convert string to MessageType.  Unknown names map to kInfo.
  static MessageType StringToMessageType(StringPiece msg);

  // Specify the minimum message type. Lower message types will not be
  // logged.
  void set_min_message_type(MessageType min) { min_message_type_ = min; }
  MessageType min_message_type() const { return min_message_type_; }

  // Log an info, warning, error or fatal error message.
  void Message(MessageType type, const char* msg, ...)
      ASSETSPEED_PRINTF_FORMAT(3, 4);
  void MessageV(MessageType type, const char* msg, va_list args);

  // Log a message with a filename and line number attached.
  void FileMessage(MessageType type, const char* filename, int line,
                   const char* msg, ...) ASSETSPEED_PRINTF_FORMAT(5, 6);
  void FileMessageV(MessageType type, const char* filename, int line,
                    const char* msg, va_list args);

  // Convenience functions for FileMessage.
  void Info(const char* filename, int line, const char* msg, ...)
      ASSETSPEED_PRINTF_FORMAT(4, 5);
  void Warning(const char* filename, int line, const char* msg, ...)
      ASSETSPEED_PRINTF_FORMAT(4, 5);
  void Error(const char* filename, int line, const char* msg, ...)
      ASSETSPEED_PRINTF_FORMAT(4, 5);
  void FatalError(const char* filename, int line, const char* msg, ...)
      ASSETSPEED_PRINTF_FORMAT(4, 5);

  void InfoV(const char* filename, int line, const char* msg, va_list args) {
    FileMessageV(kInfo, filename, line, msg, args);
  }
  void WarningV(const char* filename, int line, const char* msg, va_list a) {
    FileMessageV(kWarning, filename, line, msg, a);
  }
  void ErrorV(const char* filename, int line, const char* msg, va_list args) {
    FileMessageV(kError, filename, line, msg, args);
  }
  void FatalErrorV(const char* fname, int line, const char* msg, va_list a) {
    FileMessageV(kFatal, fname, line, msg, a);
  }

  // Unformatted messaging.  Delegating classes can call directly to
  // MessageSImpl and FileMessageSImpl, but clients should call these methods.
  void MessageS(MessageType type, const GoogleString& message);
  void FileMessageS(MessageType type, const char* filename, int line,
                    const GoogleString& message);

 protected:
  // 'MessageVImpl' and 'FileMessageVImpl' have default implementations in
  // terms of MessageSImpl and FileMessageSImpl.
  virtual void MessageVImpl(MessageType type, const char* msg,
                            va_list args);
  virtual void FileMessageVImpl(MessageType type, const char* filename,
                                int line, const char* msg, va_list args);
  // These methods don't perform any formatting on the string, since
  // delegating message handlers generally only need to format once at the
  // top of the stack and then propagate the formatted string inwards.
  virtual void MessageSImpl(MessageType type, const GoogleString& message) = 0;
  virtual void FileMessageSImpl(
      MessageType type, const char* filename, int line,
      const GoogleString& message) = 0;
  // FormatTo appends to *buffer.
  void FormatTo(GoogleString* buffer, const char* msg, va_list args);

 private:
  // The minimum message type to log at. Any messages below this level
  // will not be logged.
  MessageType min_message_type_;

  DISALLOW_COPY_AND_ASSIGN(MessageHandler);
};

// Macros for logging messages.
#define AS_LOG_INFO(handler, ...) \
    (handler)->Info(__FILE__, __LINE__, __VA_ARGS__)
#define AS_LOG_WARN(handler, ...) \
    (handler)->Warning(__FILE__, __LINE__, __VA_ARGS__)
#define AS_LOG_ERROR(handler, ...) \
    (handler)->Error(__FILE__, __LINE__, __VA_ARGS__)
#define AS_LOG_FATAL(handler, ...) \
    (handler)->FatalError(__FILE__, __LINE__, __VA_ARGS__)

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_MESSAGE_HANDLER_H_
