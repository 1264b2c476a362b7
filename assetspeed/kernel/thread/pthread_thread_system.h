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
#ifndef ASSETSPEED_KERNEL_THREAD_PTHREAD_THREAD_SYSTEM_H_
#define ASSETSPEED_KERNEL_THREAD_PTHREAD_THREAD_SYSTEM_H_

#include "assetspeed/kernel/base/abstract_mutex.h"
#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/thread_system.h"

namespace assetspeed {

class PthreadThreadImpl;

class PthreadThreadSystem : public ThreadSystem {
 public:
  PthreadThreadSystem();
  ~PthreadThreadSystem() override;

  AbstractMutex* NewMutex() override;

 protected:
  // This hook will get invoked by the implementation in the context of a
  // thread before invoking its Run() method.
  virtual void BeforeThreadRunHook();

 private:
  friend class PthreadThreadImpl;

  ThreadImpl* NewThreadImpl(ThreadSystem::Thread* wrapper,
                            ThreadSystem::ThreadFlags flags) override;

  DISALLOW_COPY_AND_ASSIGN(PthreadThreadSystem);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_THREAD_PTHREAD_THREAD_SYSTEM_H_
