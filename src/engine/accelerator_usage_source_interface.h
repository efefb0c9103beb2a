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

// Source of the per-sample list of GPU compute processes.

#ifndef NVIDLER_ENGINE_ACCELERATOR_USAGE_SOURCE_INTERFACE_H
#define NVIDLER_ENGINE_ACCELERATOR_USAGE_SOURCE_INTERFACE_H

#include <vector>

#include "base/common.h"
#include "base/types.h"

namespace nvidler {

class AcceleratorUsageSourceInterface {
 public:
  virtual ~AcceleratorUsageSourceInterface() {}
  // Replaces the contents of records with the processes holding a compute
  // context right now. Returns false if no snapshot could be obtained.
  virtual bool ListAcceleratorProcesses(
      vector<AcceleratorProcessRecord>* records) = 0;
};

}  // namespace nvidler

#endif  // NVIDLER_ENGINE_ACCELERATOR_USAGE_SOURCE_INTERFACE_H
