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


#include "assetspeed/kernel/base/message_handler.h"

#include <cstdio>

#include "assetspeed/kernel/base/file_message_handler.h"
#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/mock_message_handler.h"
#include "assetspeed/kernel/base/null_mutex.h"
#include "assetspeed/kernel/base/string.h"

namespace assetspeed {

namespace {

class MessageHandlerTest : public testing::Test {
 protected:
  MessageHandlerTest() : handler_(new NullMutex) {}

  MockMessageHandler handler_;
};

TEST_F(MessageHandlerTest, CountsByType) {
  handler_.Message(kInfo, "minified %s", "style.css");
  AS_LOG_WARN(&handler_, "slow %d", 3);
  AS_LOG_ERROR(&handler_, "cannot write %s", "/tmp/x");
  AS_LOG_ERROR(&handler_, "cannot write %s", "/tmp/y");
  EXPECT_EQ(1, handler_.MessagesOfType(kInfo));
  EXPECT_EQ(1, handler_.MessagesOfType(kWarning));
  EXPECT_EQ(2, handler_.MessagesOfType(kError));
  EXPECT_EQ(0, handler_.MessagesOfType(kFatal));
  EXPECT_EQ(4, handler_.TotalMessages());
  EXPECT_EQ(3, handler_.SeriousMessages());
  EXPECT_HAS_SUBSTR("Info: minified style.css\n", handler_.buffer());
  EXPECT_HAS_SUBSTR("cannot write /tmp/y\n", handler_.buffer());
}

TEST_F(MessageHandlerTest, MinMessageType) {
  handler_.set_min_message_type(kWarning);
  AS_LOG_INFO(&handler_, "dropped");
  handler_.MessageS(kInfo, "dropped too");
  handler_.MessageS(kWarning, "kept");
  EXPECT_EQ(0, handler_.MessagesOfType(kInfo));
  EXPECT_EQ(1, handler_.TotalMessages());
  EXPECT_HAS_SUBSTR_NE("dropped", handler_.buffer());
}

TEST_F(MessageHandlerTest, TypeNames) {
  EXPECT_STREQ("Info", handler_.MessageTypeToString(kInfo));
  EXPECT_STREQ("Fatal", handler_.MessageTypeToString(kFatal));
  EXPECT_EQ(kWarning, MessageHandler::StringToMessageType("warning"));
  EXPECT_EQ(kError, MessageHandler::StringToMessageType("Error"));
  EXPECT_EQ(kInfo, MessageHandler::StringToMessageType("bogus"));
}

TEST_F(MessageHandlerTest, FileMessageHandlerFormat) {
  FILE* file = tmpfile();
  ASSERT_TRUE(file != NULL);
  FileMessageHandler file_handler(file);
  file_handler.Message(kWarning, "plain %d", 1);
  file_handler.FileMessage(kError, "cache.cc", 12, "located");
  rewind(file);
  char buf[256];
  size_t nread = fread(buf, 1, sizeof(buf), file);
  fclose(file);
  EXPECT_EQ("Warning: plain 1\nError: cache.cc:12: located\n",
            GoogleString(buf, nread));
}

}  // namespace

}  // namespace assetspeed
