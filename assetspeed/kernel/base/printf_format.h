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

#ifndef ASSETSPEED_KERNEL_BASE_PRINTF_FORMAT_H_
#define ASSETSPEED_KERNEL_BASE_PRINTF_FORMAT_H_

// Lets gcc check printf-style format strings.  Arguments are 1-based, and
// member functions count 'this' as the first argument.
#if defined(__GNUC__)
#define ASSETSPEED_PRINTF_FORMAT(x, y) \
  __attribute__((__format__ (__printf__, x, y)))
#else
#define ASSETSPEED_PRINTF_FORMAT(x, y)
#endif

#endif  // ASSETSPEED_KERNEL_BASE_PRINTF_FORMAT_H_
