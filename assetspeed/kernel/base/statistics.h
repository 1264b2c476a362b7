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
// Interfaces for named counters.  Components declare their variables in a
// static InitStats(Statistics*) and look them up once in their
// constructors.

#ifndef ASSETSPEED_KERNEL_BASE_STATISTICS_H_
#define ASSETSPEED_KERNEL_BASE_STATISTICS_H_

#include "assetspeed/kernel/base/basictypes.h"
#include "assetspeed/kernel/base/string.h"
#include "assetspeed/kernel/base/string_util.h"

namespace assetspeed {

class MessageHandler;

// A monotonically increasing counter.
class Variable {
 public:
  virtual ~Variable();

  virtual int64 Get() const = 0;
  // Return some name representing the variable, provided that the specific
  // implementation has some sensible way of doing so.
  virtual StringPiece GetName() const = 0;

  // Adds 'non_negative_delta' to the variable's value, returning the result.
  // Negative deltas are ignored.
  int64 Add(int64 non_negative_delta) {
    if (non_negative_delta < 0) {
      return Get();
    }
    return AddHelper(non_negative_delta);
  }

  virtual void Clear() = 0;

 protected:
  virtual int64 AddHelper(int64 delta) = 0;
};

// Base class for implementations of monitoring statistics.
class Statistics {
 public:
  Statistics() {}
  virtual ~Statistics();

  // Add a new variable, or returns an existing one of that name.  The
  // Variable* is owned by the Statistics class -- it should not be deleted
  // by the caller.
  virtual Variable* AddVariable(StringPiece name) = 0;

  // Find a variable from a name, returning NULL if not found.
  virtual Variable* FindVariable(StringPiece name) const = 0;

  // Find a variable from a name.  Variables must have been added with
  // AddVariable first; an unknown name is a programming error and is
  // reported by creating the variable on the fly.
  Variable* GetVariable(StringPiece name);

  // Set all variables to 0.
  virtual void Clear() = 0;

  // Appends "name: value" lines for every variable, in name order.
  virtual void Dump(GoogleString* out) const = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(Statistics);
};

}  // namespace assetspeed

#endif  // ASSETSPEED_KERNEL_BASE_STATISTICS_H_
