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

// GPU idle monitor binary. Parses the command line into an immutable
// configuration, prepares the log file, wires the external tool adapters to
// the cycle scheduler and runs cycles until SIGINT or SIGTERM arrives.

#include <signal.h>
#include <stdlib.h>
#include <time.h>

#include <string>

#include <boost/bind.hpp>
#include <boost/scoped_ptr.hpp>

#include "base/common.h"
#include "base/monitor_config.h"
#include "engine/cycle_scheduler.h"
#include "engine/docker_container_source.h"
#include "engine/executors/local_action_executor.h"
#include "engine/nvidia_smi_usage_source.h"
#include "misc/file_log_sink.h"
#include "misc/log_maintenance.h"
#include "misc/utils.h"
#include "misc/wall_time.h"
#include "platforms/unix/process_signaller.h"
#include "platforms/unix/procfs_monitor.h"
#include "platforms/unix/ps_process_info_source.h"
#include "platforms/unix/signal_handler.h"
#include "platforms/unix/unix_socket_http_client.h"

using namespace nvidler;  // NOLINT

namespace {

void StopOnSignal(CycleScheduler* scheduler, int signum) {
  LOG(INFO) << "Shutting down GPU idle monitor on signal " << signum;
  scheduler->Stop();
}

}  // namespace

int main(int argc, char *argv[]) {
  VLOG(1) << "Calling common::InitNvidler";
  common::InitNvidler(argc, argv);

  // Block the shutdown signals before any other thread exists, so that only
  // the signal handler's thread ever sees them.
  platform_unix::SignalHandler signal_handler;
  signal_handler.ConfigureSignal(SIGINT);
  signal_handler.ConfigureSignal(SIGTERM);

  MonitorConfiguration config;
  string error;
  if (!ConfigurationFromFlags(&config, &error)) {
    LOG(ERROR) << "Invalid configuration: " << error;
    return 1;
  }

  // Rotate and clean up old logs, then attach the log file.
  RotateLogFile(config.log_file);
  PruneRotatedLogs(config.log_file, config.log_retention_days, time(NULL));
  FileLogSink log_sink(config.log_file);
  if (!log_sink.Open()) {
    LOG(ERROR) << "Failed to open log file " << config.log_file;
    return 1;
  }
  google::AddLogSink(&log_sink);

  LOG(INFO) << "Current Date: " << TimestampToLstartString(time(NULL));
  LOG(INFO) << "Configuration: " << config;

  boost::scoped_ptr<platform_unix::UnixSocketHttpClient> docker_client;
  boost::scoped_ptr<DockerContainerSource> container_source;
  if (config.docker_enabled) {
    string socket_path;
    if (!DockerContainerSource::ResolveDockerSocket(getenv("DOCKER_HOST"),
                                                    config.docker_socket,
                                                    &socket_path)) {
      LOG(ERROR) << "Failed to initialize Docker client.";
      google::RemoveLogSink(&log_sink);
      return 1;
    }
    docker_client.reset(new platform_unix::UnixSocketHttpClient(
        socket_path, config.external_command_timeout_ms));
    container_source.reset(new DockerContainerSource(docker_client.get()));
    if (!container_source->Ping())
      LOG(WARNING) << "Docker daemon at unix:" << socket_path << " is not "
                   << "responding yet; container lookups will be retried "
                   << "every cycle.";
  }

  boost::scoped_ptr<ProcessInfoSourceInterface> process_info_source;
  if (config.process_info_source == "ps") {
    process_info_source.reset(new platform_unix::PsProcessInfoSource(
        "ps", config.external_command_timeout_ms));
  } else {
    process_info_source.reset(new platform_unix::ProcFSMonitor());
  }
  NvidiaSmiUsageSource usage_source(config.nvidia_smi_binary,
                                    config.external_command_timeout_ms);
  platform_unix::PosixProcessSignaller signaller;
  executor::LocalActionExecutor action_executor(&signaller,
                                                config.idle_time_threshold);
  WallTime wall_time;

  CycleScheduler scheduler(config, &usage_source, process_info_source.get(),
                           container_source.get(), &action_executor,
                           &wall_time);
  signal_handler.Start(boost::bind(&StopOnSignal, &scheduler, _1));

  scheduler.Run();

  LOG(INFO) << "Scheduler's Run() method returned; terminating...";
  google::RemoveLogSink(&log_sink);
  log_sink.Close();
  return 0;
}
