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
// This contains the class ThreadSystem::Thread which should be subclassed
// by things that wish to run in a thread.

#ifndef ASSETSPEED_KERNEL_BASE_THREAD_H_
#define ASSETSPEED_KERNEL_BASE_THREAD_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/scoped_ptr.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/thread_system.h"

namespace assetspeed {

// Base class for client thread code.
class ThreadSystem::Thread {
 public:
  // Initializes the thread object for given runtime, but does not start it.
  // (You need to call Start() for that)
  //
  // If you pass in kJoinable for flags, you must explicitly call Join() to
  // wait for thread to complete and release associated resources. That is not
  // needed with kDetached, but you are still responsible for cleaning up
  // the Thread object.
  //
  // The 'name' will be used purely for debugging purposes. Note that on
  // many systems (e.g. Linux PThreads) the OS will only keep track of
  // 15 characters, so you may not want to get too wordy.
  Thread(ThreadSystem* runtime, StringPiece name, ThreadFlags flags);

  virtual ~Thread();

  // Invokes Run() in a separate thread. Returns if successful or not.
  // Threads are not re-startable.
  bool Start();

  // Whether Start() ran successfully on this object.
  bool Started() const { return started_; }

  // Waits for the thread executing Run() to exit. This must be called on
  // every thread created with kJoinable.  Returns false if the thread was
  // never started, is detached, or was already joined.
  bool Join();

  GoogleString name() const { return name_; }

  virtual void Run() = 0;

 private:
  scoped_ptr<ThreadImpl> impl_;
  GoogleString name_;
  ThreadFlags flags_;
  bool started_;
  bool join_called_;

  DISALLOW_COPY_AND_ASSIGN(Thread);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_THREAD_H_
