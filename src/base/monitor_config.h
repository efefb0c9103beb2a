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

// Process-wide monitor configuration. Built once from the command line flags
// at startup and passed by value into the components that need it.

#ifndef NVIDLER_BASE_MONITOR_CONFIG_H
#define NVIDLER_BASE_MONITOR_CONFIG_H

#include <ostream>
#include <string>
#include <vector>

#include "base/common.h"

namespace nvidler {

struct MonitorConfiguration {
  MonitorConfiguration();

  // Idle processes are acted upon once idle for strictly longer than this.
  int64_t idle_time_threshold;
  bool warning_only;
  // Substrings matched against process command names.
  vector<string> target_workloads;
  // Process or container names, matched exactly.
  vector<string> whitelist;
  string log_file;
  uint32_t log_retention_days;
  uint64_t sleep_interval;
  bool docker_enabled;
  string docker_socket;
  string nvidia_smi_binary;
  // Either "procfs" or "ps".
  string process_info_source;
  // Upper bound on every external tool invocation and Docker API request.
  uint64_t external_command_timeout_ms;
};

// Populates the configuration from the FLAGS_* values. Returns false and
// describes the problem in error if the flags do not form a usable
// configuration.
bool ConfigurationFromFlags(MonitorConfiguration* config, string* error);
bool ValidateConfiguration(const MonitorConfiguration& config, string* error);

ostream& operator<<(ostream& stream, const MonitorConfiguration& config);

}  // namespace nvidler

#endif  // NVIDLER_BASE_MONITOR_CONFIG_H
