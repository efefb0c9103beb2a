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

// Executes idle decisions on the local host: warnings go to the log, and
// terminations are delivered as SIGTERM through the process signaller.

#ifndef NVIDLER_ENGINE_EXECUTORS_LOCAL_ACTION_EXECUTOR_H
#define NVIDLER_ENGINE_EXECUTORS_LOCAL_ACTION_EXECUTOR_H

#include "engine/executors/action_executor_interface.h"

#include <string>

#include "base/common.h"
#include "base/types.h"
#include "engine/process_signaller_interface.h"

namespace nvidler {
namespace executor {

class LocalActionExecutor : public ActionExecutorInterface {
 public:
  LocalActionExecutor(ProcessSignallerInterface* signaller,
                      int64_t idle_time_threshold);
  bool Execute(const IdleDecision& decision);

 protected:
  FRIEND_TEST(LocalActionExecutorTest, DescriptionNamesContainer);
  // Human-readable description of the decision's process, shared by the
  // warning and termination log lines.
  string DescribeIdleProcess(const IdleDecision& decision) const;

  ProcessSignallerInterface* signaller_;
  const int64_t idle_time_threshold_;
};

}  // namespace executor
}  // namespace nvidler

#endif  // NVIDLER_ENGINE_EXECUTORS_LOCAL_ACTION_EXECUTOR_H
