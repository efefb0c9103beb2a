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

// Accelerator usage source backed by the nvidia-smi command line tool.

#ifndef NVIDLER_ENGINE_NVIDIA_SMI_USAGE_SOURCE_H
#define NVIDLER_ENGINE_NVIDIA_SMI_USAGE_SOURCE_H

#include "engine/accelerator_usage_source_interface.h"

#include <string>
#include <vector>

#include "base/common.h"
#include "base/types.h"

namespace nvidler {

class NvidiaSmiUsageSource : public AcceleratorUsageSourceInterface {
 public:
  NvidiaSmiUsageSource(const string& nvidia_smi_binary, uint64_t timeout_ms);
  bool ListAcceleratorProcesses(vector<AcceleratorProcessRecord>* records);
  // Parses "pid, used_memory_mib" lines as produced by
  // --query-compute-apps=pid,used_memory --format=csv,noheader,nounits.
  // Malformed lines are logged and skipped; returns the number skipped.
  static uint32_t ParseComputeAppsCsv(
      const string& output, vector<AcceleratorProcessRecord>* records);

 private:
  const string nvidia_smi_binary_;
  const uint64_t timeout_ms_;
};

}  // namespace nvidler

#endif  // NVIDLER_ENGINE_NVIDIA_SMI_USAGE_SOURCE_H
