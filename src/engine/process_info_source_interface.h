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

// Per-PID OS process metadata lookup.

#ifndef NVIDLER_ENGINE_PROCESS_INFO_SOURCE_INTERFACE_H
#define NVIDLER_ENGINE_PROCESS_INFO_SOURCE_INTERFACE_H

#include "base/common.h"
#include "base/types.h"

namespace nvidler {

class ProcessInfoSourceInterface {
 public:
  virtual ~ProcessInfoSourceInterface() {}
  // Returns false if there is no such process (it may have exited since the
  // accelerator sample was taken). A process whose start time cannot be
  // determined is still returned, with start_time_known unset.
  virtual bool GetProcessInfo(uint64_t pid, ProcessInfo* info) = 0;
};

}  // namespace nvidler

#endif  // NVIDLER_ENGINE_PROCESS_INFO_SOURCE_INTERFACE_H
