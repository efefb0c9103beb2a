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

// Delivers graceful termination requests to processes.

#ifndef NVIDLER_ENGINE_PROCESS_SIGNALLER_INTERFACE_H
#define NVIDLER_ENGINE_PROCESS_SIGNALLER_INTERFACE_H

#include "base/common.h"

namespace nvidler {

class ProcessSignallerInterface {
 public:
  virtual ~ProcessSignallerInterface() {}
  // Returns false if the signal could not be delivered.
  virtual bool SendTerminationSignal(uint64_t pid) = 0;
};

}  // namespace nvidler

#endif  // NVIDLER_ENGINE_PROCESS_SIGNALLER_INTERFACE_H
