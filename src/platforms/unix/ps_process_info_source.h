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

// Process metadata source that asks ps(1) for the command name and the
// lstart timestamp of a process.

#ifndef NVIDLER_PLATFORMS_UNIX_PS_PROCESS_INFO_SOURCE_H
#define NVIDLER_PLATFORMS_UNIX_PS_PROCESS_INFO_SOURCE_H

#include <string>

#include "base/common.h"
#include "base/types.h"
#include "engine/process_info_source_interface.h"

namespace nvidler {
namespace platform_unix {

class PsProcessInfoSource : public ProcessInfoSourceInterface {
 public:
  PsProcessInfoSource(const string& ps_binary, uint64_t timeout_ms);
  bool GetProcessInfo(uint64_t pid, ProcessInfo* info);

 private:
  const string ps_binary_;
  const uint64_t timeout_ms_;
};

}  // namespace platform_unix
}  // namespace nvidler

#endif  // NVIDLER_PLATFORMS_UNIX_PS_PROCESS_INFO_SOURCE_H
