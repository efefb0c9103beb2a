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

// Sends POSIX signals to local processes.

#ifndef NVIDLER_PLATFORMS_UNIX_PROCESS_SIGNALLER_H
#define NVIDLER_PLATFORMS_UNIX_PROCESS_SIGNALLER_H

#include "engine/process_signaller_interface.h"

#include "base/common.h"

namespace nvidler {
namespace platform_unix {

class PosixProcessSignaller : public ProcessSignallerInterface {
 public:
  // Sends SIGTERM. Refuses PIDs that would address process groups or init.
  bool SendTerminationSignal(uint64_t pid);
};

}  // namespace platform_unix
}  // namespace nvidler

#endif  // NVIDLER_PLATFORMS_UNIX_PROCESS_SIGNALLER_H
