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
#include "assetspeed/kernel/util/simple_stats.h"

#include "assetspeed/kernel/base/abstract_mutex.h"
#include "assetspeed/kernel/base/string_util.h"
#include "assetspeed/kernel/base/thread_system.h"

namespace assetspeed {

SimpleStatsVariable::SimpleStatsVariable(StringPiece name,
                                         AbstractMutex* mutex)
    : name_(name.data(), name.size()),
      mutex_(mutex),
      value_(0) {
}

SimpleStatsVariable::~SimpleStatsVariable() {
}

int64 SimpleStatsVariable::Get() const {
  ScopedMutex hold(mutex_.get());
  return value_;
}

void SimpleStatsVariable::Clear() {
  ScopedMutex hold(mutex_.get());
  value_ = 0;
}

int64 SimpleStatsVariable::AddHelper(int64 delta) {
  ScopedMutex hold(mutex_.get());
  value_ += delta;
  return value_;
}

SimpleStats::SimpleStats(ThreadSystem* thread_system)
    : thread_system_(thread_system),
      mutex_(thread_system->NewMutex()) {
}

SimpleStats::~SimpleStats() {
  for (VariableMap::iterator p = variables_.begin(); p != variables_.end();
       ++p) {
    delete p->second;
  }
}

Variable* SimpleStats::AddVariable(StringPiece name) {
  ScopedMutex hold(mutex_.get());
  GoogleString key(name.data(), name.size());
  VariableMap::iterator p = variables_.find(key);
  if (p != variables_.end()) {
    return p->second;
  }
  SimpleStatsVariable* var =
      new SimpleStatsVariable(name, thread_system_->NewMutex());
  variables_[key] = var;
  return var;
}

Variable* SimpleStats::FindVariable(StringPiece name) const {
  ScopedMutex hold(mutex_.get());
  VariableMap::const_iterator p =
      variables_.find(GoogleString(name.data(), name.size()));
  return (p == variables_.end()) ? NULL : p->second;
}

void SimpleStats::Clear() {
  ScopedMutex hold(mutex_.get());
  for (VariableMap::iterator p = variables_.begin(); p != variables_.end();
       ++p) {
    p->second->Clear();
  }
}

void SimpleStats::Dump(GoogleString* out) const {
  ScopedMutex hold(mutex_.get());
  for (VariableMap::const_iterator p = variables_.begin();
       p != variables_.end(); ++p) {
    StrAppend(out, p->first, ": ", p->second->Get(), "\n");
  }
}

}  // namespace assetspeed
