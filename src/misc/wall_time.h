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

#ifndef NVIDLER_MISC_WALL_TIME_H
#define NVIDLER_MISC_WALL_TIME_H

#include "misc/time_interface.h"

namespace nvidler {

// CLOCK_REALTIME, not CLOCK_MONOTONIC: process start times are epoch-based,
// so the two must move together when the system clock is adjusted.
class WallTime : public TimeInterface {
 public:
  uint64_t GetCurrentTimestamp();
};

}  // namespace nvidler

#endif  // NVIDLER_MISC_WALL_TIME_H
