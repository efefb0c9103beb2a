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

// Local action executor class.

#include "engine/executors/local_action_executor.h"

#include <sstream>
#include <string>

namespace nvidler {
namespace executor {

LocalActionExecutor::LocalActionExecutor(ProcessSignallerInterface* signaller,
                                         int64_t idle_time_threshold)
    : signaller_(signaller),
      idle_time_threshold_(idle_time_threshold) {
  CHECK_NOTNULL(signaller_);
}

string LocalActionExecutor::DescribeIdleProcess(
    const IdleDecision& decision) const {
  stringstream ss;
  ss << "Process " << decision.pid() << " (" << decision.command_name()
     << ") in Docker container "
     << (decision.container_name().empty() ? "<none>"
                                           : decision.container_name())
     << " has been idle for " << decision.idle_seconds()
     << " seconds (threshold " << idle_time_threshold_ << " seconds).";
  return ss.str();
}

bool LocalActionExecutor::Execute(const IdleDecision& decision) {
  switch (decision.action()) {
    case IdleDecision::NONE:
      VLOG(1) << "No action for PID " << decision.pid() << " ("
              << decision.command_name() << "): "
              << IdleDecision::Reason_Name(decision.reason());
      return true;
    case IdleDecision::WARN:
      LOG(WARNING) << "WARNING: " << DescribeIdleProcess(decision);
      return true;
    case IdleDecision::TERMINATE:
      if (!signaller_->SendTerminationSignal(decision.pid())) {
        LOG(ERROR) << "Failed to send SIGTERM to PID " << decision.pid()
                   << " (" << decision.command_name() << ").";
        return false;
      }
      LOG(WARNING) << "Terminated: " << DescribeIdleProcess(decision);
      return true;
    default:
      LOG(ERROR) << "Unknown action " << decision.action() << " for PID "
                 << decision.pid() << "; ignoring.";
      return false;
  }
}

}  // namespace executor
}  // namespace nvidler
