/*
 * Nvidler
 * Copyright (c) The Nvidler Authors.
 * All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * THIS CODE IS PROVIDED ON AN *AS IS* BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT
 * LIMITATION ANY IMPLIED WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR
 * A PARTICULAR PURPOSE, MERCHANTABLITY OR NON-INFRINGEMENT.
 *
 * See the Apache Version 2.0 License for specific language governing
 * permissions and limitations under the License.
 */

// Clock used to measure idle durations. The monitor runs on the real-time
// clock; tests substitute a simulated one.

#ifndef NVIDLER_MISC_TIME_INTERFACE_H
#define NVIDLER_MISC_TIME_INTERFACE_H

#include <time.h>

#include "base/common.h"
#include "base/units.h"

namespace nvidler {

class TimeInterface {
 public:
  virtual ~TimeInterface() {}
  // Current epoch timestamp in micro-seconds.
  virtual uint64_t GetCurrentTimestamp() = 0;
  // Current epoch time truncated to seconds, the resolution at which process
  // start times are known.
  time_t GetCurrentEpochSeconds() {
    return static_cast<time_t>(GetCurrentTimestamp() /
                               SECONDS_TO_MICROSECONDS);
  }
};

}  // namespace nvidler

#endif  // NVIDLER_MISC_TIME_INTERFACE_H
