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

#include "engine/idle_decision_engine.h"

#include <string>
#include <vector>

#include "misc/string_utils.h"

namespace nvidler {

IdleDecisionEngine::IdleDecisionEngine(const MonitorConfiguration& config)
  : config_(config) {
}

void IdleDecisionEngine::Evaluate(
    const vector<AcceleratorProcessRecord>& records,
    ProcessInfoSourceInterface* process_info_source,
    const vector<ContainerBinding>& bindings,
    time_t now,
    vector<IdleDecision>* decisions) const {
  CHECK_NOTNULL(decisions);
  for (vector<AcceleratorProcessRecord>::const_iterator it = records.begin();
       it != records.end();
       ++it) {
    IdleDecision decision;
    if (EvaluateRecord(*it, process_info_source, bindings, now, &decision))
      decisions->push_back(decision);
  }
}

bool IdleDecisionEngine::EvaluateRecord(
    const AcceleratorProcessRecord& record,
    ProcessInfoSourceInterface* process_info_source,
    const vector<ContainerBinding>& bindings,
    time_t now,
    IdleDecision* decision) const {
  CHECK_NOTNULL(process_info_source);
  ProcessInfo info;
  if (!process_info_source->GetProcessInfo(record.pid(), &info)) {
    LOG(INFO) << "PID " << record.pid() << " is no longer running; skipping.";
    return false;
  }
  const string* container_name = NULL;
  if (config_.docker_enabled)
    container_name = ResolveContainerName(record.pid(), bindings);
  if (!IsTargeted(info.command_name)) {
    VLOG(2) << "PID " << record.pid() << " (" << info.command_name
            << ") is not a target workload.";
    return false;
  }
  decision->set_pid(record.pid());
  decision->set_command_name(info.command_name);
  if (container_name)
    decision->set_container_name(*container_name);
  decision->set_idle_seconds(0);
  decision->set_action(IdleDecision::NONE);
  if (IsWhitelisted(info.command_name) ||
      (container_name && IsWhitelisted(*container_name))) {
    decision->set_reason(IdleDecision::WHITELISTED);
    return true;
  }
  if (record.used_memory_bytes() != 0) {
    decision->set_reason(IdleDecision::ACTIVE);
    return true;
  }
  if (!info.start_time_known) {
    LOG(WARNING) << "Failed to get start time for PID " << record.pid()
                 << " (" << info.command_name << "); taking no action.";
    return false;
  }
  // Idle time counts from process start, not from the last sample in which
  // the process was active.
  int64_t idle_seconds = static_cast<int64_t>(now) -
                         static_cast<int64_t>(info.start_time);
  decision->set_idle_seconds(idle_seconds);
  if (idle_seconds <= config_.idle_time_threshold) {
    decision->set_reason(IdleDecision::BELOW_THRESHOLD);
    return true;
  }
  decision->set_reason(IdleDecision::IDLE_OVER_THRESHOLD);
  decision->set_action(config_.warning_only ? IdleDecision::WARN
                                            : IdleDecision::TERMINATE);
  return true;
}

bool IdleDecisionEngine::IsTargeted(const string& command_name) const {
  return ContainsAnySubstring(command_name, config_.target_workloads);
}

bool IdleDecisionEngine::IsWhitelisted(const string& name) const {
  return MatchesAnyExactly(name, config_.whitelist);
}

const string* IdleDecisionEngine::ResolveContainerName(
    uint64_t pid, const vector<ContainerBinding>& bindings) const {
  // If several containers claim the same root PID, the first one enumerated
  // wins.
  for (vector<ContainerBinding>::const_iterator it = bindings.begin();
       it != bindings.end();
       ++it) {
    if (it->root_pid() == pid)
      return &it->container_name();
  }
  return NULL;
}

}  // namespace nvidler
