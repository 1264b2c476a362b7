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
// Implementation of the Thread class, which routes things to an underlying
// ThreadImpl.

#include "assetspeed/kernel/base/thread.h"

#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/thread_system.h"

namespace assetspeed {

ThreadSystem::Thread::Thread(ThreadSystem* runtime, StringPiece name,
                             ThreadFlags flags)
    : impl_(runtime->NewThreadImpl(this, flags)),
      name_(name.data(), name.size()),
      flags_(flags),
      started_(false),
      join_called_(false) {
}

ThreadSystem::Thread::~Thread() {
}

bool ThreadSystem::Thread::Start() {
  if (started_) {
    // Threads cannot be restarted, create a new instance.
    return false;
  }
  started_ = impl_->StartImpl();
  return started_;
}

bool ThreadSystem::Thread::Join() {
  if (!started_ || ((flags_ & ThreadSystem::kJoinable) == 0) ||
      join_called_) {
    return false;
  }
  join_called_ = true;
  impl_->JoinImpl();
  return true;
}

}  // namespace assetspeed
