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

#include "sim/simulated_wall_time.h"

#include "base/units.h"

namespace nvidler {

SimulatedWallTime::SimulatedWallTime(uint64_t initial_timestamp)
  : current_timestamp_(initial_timestamp) {
}

SimulatedWallTime::~SimulatedWallTime() {
}

uint64_t SimulatedWallTime::GetCurrentTimestamp() {
  return current_timestamp_;
}

void SimulatedWallTime::UpdateCurrentTimestamp(uint64_t timestamp) {
  current_timestamp_ = timestamp;
}

void SimulatedWallTime::AdvanceSeconds(uint64_t seconds) {
  current_timestamp_ += seconds * SECONDS_TO_MICROSECONDS;
}

}  // namespace nvidler
