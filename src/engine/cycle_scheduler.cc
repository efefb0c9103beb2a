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

#include "engine/cycle_scheduler.h"

#include <sstream>
#include <vector>

#include <boost/thread/thread_time.hpp>

#include "base/units.h"

namespace nvidler {

CycleScheduler::CycleScheduler(
    const MonitorConfiguration& config,
    AcceleratorUsageSourceInterface* usage_source,
    ProcessInfoSourceInterface* process_info_source,
    ContainerIdentitySourceInterface* container_source,
    ActionExecutorInterface* action_executor,
    TimeInterface* time_manager)
  : config_(config),
    decision_engine_(config),
    usage_source_(usage_source),
    process_info_source_(process_info_source),
    container_source_(container_source),
    action_executor_(action_executor),
    time_manager_(time_manager),
    stop_requested_(false) {
  CHECK_NOTNULL(usage_source_);
  CHECK_NOTNULL(process_info_source_);
  CHECK_NOTNULL(action_executor_);
  CHECK_NOTNULL(time_manager_);
  if (config_.docker_enabled)
    CHECK_NOTNULL(container_source_);
}

bool CycleScheduler::RunCycle(CycleSummary* summary) {
  CHECK_NOTNULL(summary);
  vector<AcceleratorProcessRecord> records;
  if (!usage_source_->ListAcceleratorProcesses(&records)) {
    LOG(WARNING) << "Failed to query GPU processes; skipping this cycle.";
    return false;
  }
  summary->records = records.size();
  LogAcceleratorSnapshot(records);
  if (records.empty())
    return true;
  vector<ContainerBinding> bindings;
  if (config_.docker_enabled &&
      !container_source_->ListContainerBindings(&bindings)) {
    // Without the container set, container whitelisting cannot be applied,
    // so no action is taken at all this cycle.
    LOG(WARNING) << "Failed to get Docker container list; skipping this "
                 << "cycle.";
    return false;
  }
  time_t now = time_manager_->GetCurrentEpochSeconds();
  vector<IdleDecision> decisions;
  decision_engine_.Evaluate(records, process_info_source_, bindings, now,
                            &decisions);
  summary->decisions = decisions.size();
  for (vector<IdleDecision>::const_iterator it = decisions.begin();
       it != decisions.end();
       ++it) {
    if (StopRequested()) {
      LOG(INFO) << "Stop requested; abandoning the rest of this cycle.";
      return false;
    }
    bool success = action_executor_->Execute(*it);
    if (it->action() == IdleDecision::WARN) {
      summary->warnings++;
    } else if (it->action() == IdleDecision::TERMINATE) {
      if (success)
        summary->terminations++;
      else
        summary->failed_terminations++;
    }
  }
  return true;
}

void CycleScheduler::Run() {
  LOG(INFO) << "Starting GPU idle monitor...";
  boost::unique_lock<boost::mutex> lock(stop_mut_);
  while (!stop_requested_) {
    lock.unlock();
    CycleSummary summary;
    bool completed = RunCycle(&summary);
    VLOG(1) << "Cycle " << (completed ? "completed" : "abandoned") << ": "
            << summary.records << " GPU processes, " << summary.decisions
            << " decisions, " << summary.warnings << " warnings, "
            << summary.terminations << " terminations, "
            << summary.failed_terminations << " failed terminations";
    lock.lock();
    boost::system_time wakeup = boost::get_system_time() +
        boost::posix_time::seconds(
            static_cast<long>(config_.sleep_interval));  // NOLINT
    while (!stop_requested_) {
      if (!stop_.timed_wait(lock, wakeup))
        break;
    }
  }
  LOG(INFO) << "GPU idle monitor stopped.";
}

void CycleScheduler::Stop() {
  boost::lock_guard<boost::mutex> lock(stop_mut_);
  stop_requested_ = true;
  stop_.notify_all();
}

bool CycleScheduler::StopRequested() {
  boost::lock_guard<boost::mutex> lock(stop_mut_);
  return stop_requested_;
}

void CycleScheduler::LogAcceleratorSnapshot(
    const vector<AcceleratorProcessRecord>& records) const {
  stringstream ss;
  for (vector<AcceleratorProcessRecord>::const_iterator it = records.begin();
       it != records.end();
       ++it) {
    ss << "\n" << it->pid() << ", " << it->used_memory_bytes() / MB_TO_BYTES
       << " MiB";
  }
  LOG(INFO) << "Current GPU processes (" << records.size() << "):"
            << ss.str();
}

}  // namespace nvidler
