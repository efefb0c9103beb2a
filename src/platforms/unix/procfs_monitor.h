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

// Process metadata source that reads command names and start times from
// ProcFS.

#ifndef NVIDLER_PLATFORMS_UNIX_PROCFS_MONITOR_H
#define NVIDLER_PLATFORMS_UNIX_PROCFS_MONITOR_H

#include <time.h>

#include <string>

#include "base/common.h"
#include "base/types.h"
#include "engine/process_info_source_interface.h"

namespace nvidler {
namespace platform_unix {

class ProcFSMonitor : public ProcessInfoSourceInterface {
 public:
  ProcFSMonitor();
  // proc_root allows pointing the monitor at a copy of /proc.
  explicit ProcFSMonitor(const string& proc_root);
  bool GetProcessInfo(uint64_t pid, ProcessInfo* info);

  inline uint64_t ticks_per_sec() { return ticks_per_sec_; }
  inline time_t boot_time() { return boot_time_; }

 protected:
  // Reads the system boot time ("btime") from <proc_root>/stat.
  bool ReadBootTime(time_t* boot_time);
  // Reads the start time field, in clock ticks since boot, from
  // <proc_root>/<pid>/stat.
  bool ReadStartTicks(uint64_t pid, uint64_t* start_ticks);

 private:
  const string proc_root_;
  uint64_t ticks_per_sec_;
  bool boot_time_known_;
  time_t boot_time_;
};

}  // namespace platform_unix
}  // namespace nvidler

#endif  // NVIDLER_PLATFORMS_UNIX_PROCFS_MONITOR_H
