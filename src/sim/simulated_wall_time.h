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

// Manually advanced clock for tests.

#ifndef NVIDLER_SIM_SIMULATED_WALL_TIME_H
#define NVIDLER_SIM_SIMULATED_WALL_TIME_H

#include "misc/time_interface.h"

namespace nvidler {

class SimulatedWallTime : public TimeInterface {
 public:
  explicit SimulatedWallTime(uint64_t initial_timestamp);
  virtual ~SimulatedWallTime();

  /**
   * Get the current simulated timestamp (in u-sec).
   */
  uint64_t GetCurrentTimestamp();

  /**
   * Overwrites the current simulated timestamp.
   */
  void UpdateCurrentTimestamp(uint64_t timestamp);

  /**
   * Moves the clock forward by the given number of seconds.
   */
  void AdvanceSeconds(uint64_t seconds);

 private:
  uint64_t current_timestamp_;
};

}  // namespace nvidler

#endif  // NVIDLER_SIM_SIMULATED_WALL_TIME_H
