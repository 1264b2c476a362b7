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


#include "assetspeed/kernel/thread/pthread_thread_system.h"

#include "assetspeed/kernel/base/abstract_mutex.h"
#include "assetspeed/kernel/base/gtest.h"
#include "assetspeed/kernel/base/scoped_ptr.h"
#include "assetspeed/kernel/base/thread.h"
#include "assetspeed/kernel/base/thread_system.h"

namespace assetspeed {

namespace {

class CountingThread : public ThreadSystem::Thread {
 public:
  CountingThread(ThreadSystem* runtime, AbstractMutex* mutex, int* counter)
      : Thread(runtime, "counter", ThreadSystem::kJoinable),
        mutex_(mutex),
        counter_(counter) {
  }

  void Run() override {
    for (int i = 0; i < 1000; ++i) {
      ScopedMutex lock(mutex_);
      ++*counter_;
    }
  }

 private:
  AbstractMutex* mutex_;
  int* counter_;
};

TEST(PthreadThreadSystemTest, JoinableThreadsShareMutex) {
  scoped_ptr<ThreadSystem> thread_system(new PthreadThreadSystem);
  scoped_ptr<AbstractMutex> mutex(thread_system->NewMutex());
  int counter = 0;
  CountingThread a(thread_system.get(), mutex.get(), &counter);
  CountingThread b(thread_system.get(), mutex.get(), &counter);
  EXPECT_FALSE(a.Started());
  ASSERT_TRUE(a.Start());
  ASSERT_TRUE(b.Start());
  EXPECT_TRUE(a.Started());
  EXPECT_TRUE(a.Join());
  EXPECT_TRUE(b.Join());
  EXPECT_EQ(2000, counter);
  // A second join is a misuse and is refused.
  EXPECT_FALSE(a.Join());
}

TEST(PthreadThreadSystemTest, UnstartedThreadCannotJoin) {
  scoped_ptr<ThreadSystem> thread_system(ThreadSystem::CreateThreadSystem());
  scoped_ptr<AbstractMutex> mutex(thread_system->NewMutex());
  int counter = 0;
  CountingThread thread(thread_system.get(), mutex.get(), &counter);
  EXPECT_EQ("counter", thread.name());
  EXPECT_FALSE(thread.Join());
  EXPECT_EQ(0, counter);
}

TEST(PthreadThreadSystemTest, TryLock) {
  PthreadThreadSystem thread_system;
  scoped_ptr<AbstractMutex> mutex(thread_system.NewMutex());
  EXPECT_TRUE(mutex->TryLock());
  mutex->Unlock();
  {
    ScopedMutex lock(mutex.get());
  }
  EXPECT_TRUE(mutex->TryLock());
  mutex->Unlock();
}

}  // namespace

}  // namespace assetspeed
