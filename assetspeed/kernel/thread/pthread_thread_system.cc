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

#include <pthread.h>

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/thread.h"
#include "assetspeed/kernel/base/thread_system.h"
#include "assetspeed/kernel/thread/pthread_mutex.h"

namespace assetspeed {

class PthreadThreadImpl : public ThreadSystem::ThreadImpl {
 public:
  PthreadThreadImpl(PthreadThreadSystem* thread_system,
                    ThreadSystem::Thread* wrapper,
                    ThreadSystem::ThreadFlags flags)
      : thread_system_(thread_system),
        wrapper_(wrapper),
        flags_(flags) {
  }

  ~PthreadThreadImpl() override {
  }

  bool StartImpl() override {
    pthread_attr_t attr;
    if (pthread_attr_init(&attr) != 0) {
      return false;
    }

    int mode = PTHREAD_CREATE_DETACHED;
    if ((flags_ & ThreadSystem::kJoinable) != 0) {
      mode = PTHREAD_CREATE_JOINABLE;
    }

    bool ok = (pthread_attr_setdetachstate(&attr, mode) == 0) &&
        (pthread_create(&thread_obj_, &attr, InvokeRun, this) == 0);
    pthread_attr_destroy(&attr);
    return ok;
  }

  void JoinImpl() override {
    void* ignored;
    pthread_join(thread_obj_, &ignored);
  }

 private:
  static void* InvokeRun(void* self_ptr) {
    PthreadThreadImpl* self = static_cast<PthreadThreadImpl*>(self_ptr);
    self->thread_system_->BeforeThreadRunHook();

#ifdef __GLIBC__
    GoogleString name = self->wrapper_->name();
    // We need to truncate any long names to 15 characters or they might
    // not take.
    if (name.length() > 15) {
      name = name.substr(0, 15);
    }
    pthread_setname_np(pthread_self(), name.c_str());
#endif

    self->wrapper_->Run();
    return NULL;
  }

  PthreadThreadSystem* thread_system_;
  ThreadSystem::Thread* wrapper_;
  ThreadSystem::ThreadFlags flags_;
  pthread_t thread_obj_;

  DISALLOW_COPY_AND_ASSIGN(PthreadThreadImpl);
};

PthreadThreadSystem::PthreadThreadSystem() {
}

PthreadThreadSystem::~PthreadThreadSystem() {
}

AbstractMutex* PthreadThreadSystem::NewMutex() {
  return new PthreadMutex;
}

void PthreadThreadSystem::BeforeThreadRunHook() {
}

ThreadSystem::ThreadImpl* PthreadThreadSystem::NewThreadImpl(
    ThreadSystem::Thread* wrapper, ThreadSystem::ThreadFlags flags) {
  return new PthreadThreadImpl(this, wrapper, flags);
}

}  // namespace assetspeed
