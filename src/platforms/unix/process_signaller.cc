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

#include "platforms/unix/process_signaller.h"

#include <signal.h>
#include <sys/types.h>

#include <limits>

namespace nvidler {
namespace platform_unix {

bool PosixProcessSignaller::SendTerminationSignal(uint64_t pid) {
  // kill(2) treats 0 and negative PIDs as process groups.
  if (pid <= 1 || pid > static_cast<uint64_t>(numeric_limits<pid_t>::max())) {
    LOG(ERROR) << "Refusing to signal invalid PID " << pid;
    return false;
  }
  if (kill(static_cast<pid_t>(pid), SIGTERM) != 0) {
    PLOG(WARNING) << "kill(2) with SIGTERM for PID " << pid << " failed";
    return false;
  }
  VLOG(1) << "Sent SIGTERM to PID " << pid;
  return true;
}

}  // namespace platform_unix
}  // namespace nvidler
