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

// Drives the monitor. Once per sleep interval, the idle decision engine is
// run over fresh snapshots and its decisions are handed to the action
// executor. Cycles never overlap, and no state carries over between them.

#ifndef NVIDLER_ENGINE_CYCLE_SCHEDULER_H
#define NVIDLER_ENGINE_CYCLE_SCHEDULER_H

#include <vector>

#include <boost/thread/condition.hpp>
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>

#include "base/common.h"
#include "base/monitor_config.h"
#include "base/types.h"
#include "engine/accelerator_usage_source_interface.h"
#include "engine/container_identity_source_interface.h"
#include "engine/executors/action_executor_interface.h"
#include "engine/idle_decision_engine.h"
#include "engine/process_info_source_interface.h"
#include "misc/time_interface.h"

namespace nvidler {

using executor::ActionExecutorInterface;

class CycleScheduler {
 public:
  // container_source may be NULL if Docker tracking is disabled. None of the
  // collaborators are owned.
  CycleScheduler(const MonitorConfiguration& config,
                 AcceleratorUsageSourceInterface* usage_source,
                 ProcessInfoSourceInterface* process_info_source,
                 ContainerIdentitySourceInterface* container_source,
                 ActionExecutorInterface* action_executor,
                 TimeInterface* time_manager);
  // Runs one cycle. Returns false if the cycle was abandoned, either because
  // a snapshot could not be obtained or because a stop was requested.
  bool RunCycle(CycleSummary* summary);
  // Runs cycles until Stop() is called.
  void Run();
  void Stop();
  bool StopRequested();

 protected:
  void LogAcceleratorSnapshot(
      const vector<AcceleratorProcessRecord>& records) const;

  const MonitorConfiguration config_;
  IdleDecisionEngine decision_engine_;
  AcceleratorUsageSourceInterface* usage_source_;
  ProcessInfoSourceInterface* process_info_source_;
  ContainerIdentitySourceInterface* container_source_;
  ActionExecutorInterface* action_executor_;
  TimeInterface* time_manager_;
  boost::condition stop_;
  boost::mutex stop_mut_;
  bool stop_requested_;
};

}  // namespace nvidler

#endif  // NVIDLER_ENGINE_CYCLE_SCHEDULER_H
