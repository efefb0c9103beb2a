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

// Simple wrapper to poll process information from ProcFS.

#include "platforms/unix/procfs_monitor.h"

#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace nvidler {
namespace platform_unix {

namespace {

// Field 22 of /proc/[pid]/stat, counted from the state field (field 3) that
// follows the parenthesised command name.
const size_t kStartTimeFieldAfterComm = 22 - 3;

}  // namespace

ProcFSMonitor::ProcFSMonitor()
  : proc_root_("/proc"),
    boot_time_known_(false),
    boot_time_(0) {
  ticks_per_sec_ = sysconf(_SC_CLK_TCK);
  boot_time_known_ = ReadBootTime(&boot_time_);
}

ProcFSMonitor::ProcFSMonitor(const string& proc_root)
  : proc_root_(proc_root),
    boot_time_known_(false),
    boot_time_(0) {
  ticks_per_sec_ = sysconf(_SC_CLK_TCK);
  boot_time_known_ = ReadBootTime(&boot_time_);
}

bool ProcFSMonitor::GetProcessInfo(uint64_t pid, ProcessInfo* info) {
  CHECK_NOTNULL(info);
  // /proc/[pid]/comm parsing
  string filename = proc_root_ + "/" + to_string(pid) + "/comm";
  ifstream comm_input(filename.c_str());
  // The procfs file may no longer be there if the process has finished
  if (!comm_input)
    return false;
  string command_name;
  getline(comm_input, command_name);
  boost::trim(command_name);
  info->pid = pid;
  info->command_name = command_name;
  info->start_time_known = false;
  info->start_time = 0;
  uint64_t start_ticks = 0;
  if (!boot_time_known_) {
    LOG(WARNING) << "System boot time unknown; cannot compute start time for "
                 << "PID " << pid;
  } else if (!ReadStartTicks(pid, &start_ticks)) {
    LOG(WARNING) << "Failed to get start time for PID " << pid;
  } else {
    info->start_time = boot_time_ +
        static_cast<time_t>(start_ticks / ticks_per_sec_);
    info->start_time_known = true;
  }
  return true;
}

bool ProcFSMonitor::ReadBootTime(time_t* boot_time) {
  string filename = proc_root_ + "/stat";
  ifstream input(filename.c_str());
  if (!input) {
    PLOG(ERROR) << "Failed to open " << filename;
    return false;
  }
  string line;
  while (getline(input, line)) {
    if (!boost::starts_with(line, "btime "))
      continue;
    try {
      *boot_time = boost::lexical_cast<time_t>(
          boost::trim_copy(line.substr(6)));
      return true;
    } catch (const boost::bad_lexical_cast& e) {
      LOG(ERROR) << "Unparseable boot time line '" << line << "' in "
                 << filename;
      return false;
    }
  }
  LOG(ERROR) << "No btime entry in " << filename;
  return false;
}

bool ProcFSMonitor::ReadStartTicks(uint64_t pid, uint64_t* start_ticks) {
  // /proc/[pid]/stat parsing
  string filename = proc_root_ + "/" + to_string(pid) + "/stat";
  ifstream input(filename.c_str());
  if (!input)
    return false;
  string contents;
  getline(input, contents);
  // The command name may itself contain spaces and parentheses, so skip to
  // the last closing parenthesis.
  size_t comm_end = contents.rfind(')');
  if (comm_end == string::npos)
    return false;
  vector<string> fields;
  string rest = boost::trim_copy(contents.substr(comm_end + 1));
  boost::split(fields, rest, boost::is_any_of(" "), boost::token_compress_on);
  if (fields.size() <= kStartTimeFieldAfterComm)
    return false;
  try {
    *start_ticks = boost::lexical_cast<uint64_t>(
        fields[kStartTimeFieldAfterComm]);
  } catch (const boost::bad_lexical_cast& e) {
    return false;
  }
  return true;
}

}  // namespace platform_unix
}  // namespace nvidler
