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
#ifndef ASSETSPEED_KERNEL_THREAD_PTHREAD_MUTEX_H_
#define ASSETSPEED_KERNEL_THREAD_PTHREAD_MUTEX_H_

#include <pthread.h>

#include "assetspeed/kernel/base/abstract_mutex.h"
#include "assetspeed/kernel/base/basictypes.h"

namespace assetspeed {

// Implementation of AbstractMutex for Pthread mutexes.
class PthreadMutex : public AbstractMutex {
 public:
  PthreadMutex();
  ~PthreadMutex() override;
  bool TryLock() override;
  void Lock() override;
  void Unlock() override;

 private:
  pthread_mutex_t mutex_;

  DISALLOW_COPY_AND_ASSIGN(PthreadMutex);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_THREAD_PTHREAD_MUTEX_H_
