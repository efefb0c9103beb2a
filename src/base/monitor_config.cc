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

// Command line flags and the immutable configuration built from them.

#include "base/monitor_config.h"

#include <string>
#include <vector>

#include <boost/algorithm/string/join.hpp>

#include "misc/string_utils.h"

DEFINE_int32(idle_time_threshold, 300,
             "Time threshold for idle GPU processes, in seconds.");
DEFINE_bool(warning_only, true,
            "Only log a warning for idle processes instead of sending them "
            "SIGTERM.");
DEFINE_string(target_workloads, "python,tensorflow,cuda,pytorch",
              "Comma-separated substrings of process names to monitor.");
DEFINE_string(whitelist,
              "whitelisted_process,whitelisted_container,nvidia-smi,nvidler",
              "Comma-separated process and Docker container names that are "
              "never acted upon.");
DEFINE_string(log_file, "/var/log/gpu_idle_monitor.log",
              "Log file. An existing file is rotated to <log_file>.1 at "
              "startup.");
DEFINE_int32(log_retention_days, 7,
             "Rotated log files older than this many days are deleted at "
             "startup.");
DEFINE_int32(sleep_interval, 60, "Sleep interval between cycles, in seconds.");
DEFINE_bool(docker, true, "Enable Docker container tracking.");
DEFINE_string(docker_socket, "/var/run/docker.sock",
              "Docker Engine API socket. A unix:// DOCKER_HOST in the "
              "environment takes precedence.");
DEFINE_string(nvidia_smi_binary, "nvidia-smi",
              "Accelerator query tool to invoke for compute process usage.");
DEFINE_string(process_info_source, "procfs",
              "Where process names and start times come from: \"procfs\" or "
              "\"ps\".");
DEFINE_int32(external_command_timeout_ms, 10000,
             "Timeout for each external tool invocation and Docker API "
             "request, in milliseconds.");

namespace nvidler {

MonitorConfiguration::MonitorConfiguration()
  : idle_time_threshold(300),
    warning_only(true),
    log_retention_days(7),
    sleep_interval(60),
    docker_enabled(true),
    docker_socket("/var/run/docker.sock"),
    nvidia_smi_binary("nvidia-smi"),
    process_info_source("procfs"),
    external_command_timeout_ms(10000) {
}

bool ConfigurationFromFlags(MonitorConfiguration* config, string* error) {
  CHECK_NOTNULL(config);
  if (FLAGS_idle_time_threshold < 0) {
    *error = "idle_time_threshold must not be negative";
    return false;
  }
  if (FLAGS_sleep_interval <= 0) {
    *error = "sleep_interval must be positive";
    return false;
  }
  if (FLAGS_log_retention_days < 0) {
    *error = "log_retention_days must not be negative";
    return false;
  }
  if (FLAGS_external_command_timeout_ms <= 0) {
    *error = "external_command_timeout_ms must be positive";
    return false;
  }
  config->idle_time_threshold = FLAGS_idle_time_threshold;
  config->warning_only = FLAGS_warning_only;
  config->target_workloads = SplitCommaSeparatedList(FLAGS_target_workloads);
  config->whitelist = SplitCommaSeparatedList(FLAGS_whitelist);
  config->log_file = FLAGS_log_file;
  config->log_retention_days =
      static_cast<uint32_t>(FLAGS_log_retention_days);
  config->sleep_interval = static_cast<uint64_t>(FLAGS_sleep_interval);
  config->docker_enabled = FLAGS_docker;
  config->docker_socket = FLAGS_docker_socket;
  config->nvidia_smi_binary = FLAGS_nvidia_smi_binary;
  config->process_info_source = FLAGS_process_info_source;
  config->external_command_timeout_ms =
      static_cast<uint64_t>(FLAGS_external_command_timeout_ms);
  return ValidateConfiguration(*config, error);
}

bool ValidateConfiguration(const MonitorConfiguration& config, string* error) {
  if (config.idle_time_threshold < 0) {
    *error = "idle time threshold must not be negative";
    return false;
  }
  if (config.sleep_interval == 0) {
    *error = "sleep interval must be positive";
    return false;
  }
  if (config.target_workloads.empty()) {
    *error = "no target workloads configured";
    return false;
  }
  if (config.log_file.empty()) {
    *error = "no log file configured";
    return false;
  }
  if (config.nvidia_smi_binary.empty()) {
    *error = "no accelerator query tool configured";
    return false;
  }
  if (config.process_info_source != "procfs" &&
      config.process_info_source != "ps") {
    *error = "unknown process info source '" + config.process_info_source +
             "'";
    return false;
  }
  if (config.docker_enabled && config.docker_socket.empty()) {
    *error = "Docker tracking enabled, but no Docker socket configured";
    return false;
  }
  if (config.external_command_timeout_ms == 0) {
    *error = "external command timeout must be positive";
    return false;
  }
  return true;
}

ostream& operator<<(ostream& stream, const MonitorConfiguration& config) {
  return stream << "idle_time_threshold=" << config.idle_time_threshold
                << ", warning_only=" << boolalpha << config.warning_only
                << ", target_workloads=["
                << boost::algorithm::join(config.target_workloads, " ")
                << "], whitelist=["
                << boost::algorithm::join(config.whitelist, " ")
                << "], log_file=" << config.log_file
                << ", log_retention_days=" << config.log_retention_days
                << ", sleep_interval=" << config.sleep_interval
                << ", docker_enabled=" << config.docker_enabled
                << ", docker_socket=" << config.docker_socket
                << ", nvidia_smi_binary=" << config.nvidia_smi_binary
                << ", process_info_source=" << config.process_info_source
                << ", external_command_timeout_ms="
                << config.external_command_timeout_ms << noboolalpha;
}

}  // namespace nvidler
