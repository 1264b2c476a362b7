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
#ifndef ASSETSPEED_KERNEL_BASE_THREAD_SYSTEM_H_
#define ASSETSPEED_KERNEL_BASE_THREAD_SYSTEM_H_

#include "assetspeed/kernel/base/abstract_mutex.h"
#include "assetspeed/kernel/base/basictypes.h"

namespace assetspeed {

// Subclasses of this represent threading support under given environment,
// and help create various primitives for it.
class ThreadSystem {
 public:
  class Thread;
  class ThreadImpl;

  enum ThreadFlags {
    kDetached = 0,
    kJoinable = 1
  };

  virtual ~ThreadSystem();

  // Makes a new mutex for this system.
  virtual AbstractMutex* NewMutex() = 0;

  // Creates an appropriate ThreadSystem for the platform.
  static ThreadSystem* CreateThreadSystem();

 protected:
  ThreadSystem() {}

 private:
  friend class Thread;

  // Create and return the actual thread implementation.  The Thread class
  // will take ownership of the object.
  virtual ThreadImpl* NewThreadImpl(Thread* wrapper, ThreadFlags flags) = 0;

  DISALLOW_COPY_AND_ASSIGN(ThreadSystem);
};

// Implementation of threading, which is hidden behind Thread.
class ThreadSystem::ThreadImpl {
 public:
  virtual bool StartImpl() = 0;
  virtual void JoinImpl() = 0;
  virtual ~ThreadImpl();

 protected:
  ThreadImpl() {}

 private:
  DISALLOW_COPY_AND_ASSIGN(ThreadImpl);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_THREAD_SYSTEM_H_
