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

#include "platforms/unix/ps_process_info_source.h"

#include <string>
#include <vector>

#include <boost/algorithm/string/trim.hpp>

#include "misc/utils.h"

namespace nvidler {
namespace platform_unix {

PsProcessInfoSource::PsProcessInfoSource(const string& ps_binary,
                                         uint64_t timeout_ms)
  : ps_binary_(ps_binary),
    timeout_ms_(timeout_ms) {
}

bool PsProcessInfoSource::GetProcessInfo(uint64_t pid, ProcessInfo* info) {
  CHECK_NOTNULL(info);
  string pid_str = to_string(pid);
  vector<string> args;
  args.push_back("-p");
  args.push_back(pid_str);
  args.push_back("-o");
  args.push_back("comm=");
  string output;
  // ps exits non-zero if there is no such process.
  if (!RunCommandWithTimeout(ps_binary_, args, timeout_ms_, &output)) {
    VLOG(1) << "Failed to get process name for PID " << pid;
    return false;
  }
  string command_name = boost::algorithm::trim_copy(output);
  if (command_name.empty())
    return false;
  info->pid = pid;
  info->command_name = command_name;
  info->start_time_known = false;
  info->start_time = 0;

  // Run under the C locale so that lstart uses English day and month names.
  args.clear();
  args.push_back("LC_ALL=C");
  args.push_back(ps_binary_);
  args.push_back("-o");
  args.push_back("lstart=");
  args.push_back("-p");
  args.push_back(pid_str);
  if (!RunCommandWithTimeout("env", args, timeout_ms_, &output)) {
    LOG(WARNING) << "Failed to get start time for PID " << pid;
    return true;
  }
  time_t start_time;
  if (!ParseLstartTimestamp(output, &start_time)) {
    LOG(WARNING) << "Unparseable start time '"
                 << boost::algorithm::trim_copy(output) << "' for PID "
                 << pid;
    return true;
  }
  info->start_time = start_time;
  info->start_time_known = true;
  return true;
}

}  // namespace platform_unix
}  // namespace nvidler
