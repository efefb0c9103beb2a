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

// Common type definitions.

#ifndef NVIDLER_BASE_TYPES_H
#define NVIDLER_BASE_TYPES_H

#include <stdint.h>
#include <time.h>

#include <string>
#include <vector>
#include <memory>

#include "base/accelerator_process.pb.h"
#include "base/container_binding.pb.h"
#include "base/idle_decision.pb.h"

namespace nvidler {

using std::string;
using std::vector;
using std::unique_ptr;
using std::shared_ptr;

// OS-level metadata for a single process, looked up on demand.
struct ProcessInfo {
  ProcessInfo() : pid(0), start_time_known(false), start_time(0) {}

  uint64_t pid;
  string command_name;
  // False if the start time could not be obtained or parsed; such a process
  // is never acted upon.
  bool start_time_known;
  // Seconds since the epoch.
  time_t start_time;
};

// Outcome counts for one polling cycle.
struct CycleSummary {
  CycleSummary()
    : records(0), decisions(0), warnings(0), terminations(0),
      failed_terminations(0) {}

  uint64_t records;
  uint64_t decisions;
  uint64_t warnings;
  uint64_t terminations;
  uint64_t failed_terminations;
};

}  // namespace nvidler

#endif  // NVIDLER_BASE_TYPES_H
