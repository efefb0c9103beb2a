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

// The idle decision engine correlates one cycle's accelerator sample with
// process metadata and container identity, and decides what to do about each
// targeted process. It holds no state besides the configuration, so
// evaluating the same inputs twice yields the same decisions.

#ifndef NVIDLER_ENGINE_IDLE_DECISION_ENGINE_H
#define NVIDLER_ENGINE_IDLE_DECISION_ENGINE_H

#include <string>
#include <vector>

#include "base/common.h"
#include "base/monitor_config.h"
#include "base/types.h"
#include "engine/process_info_source_interface.h"

namespace nvidler {

class IdleDecisionEngine {
 public:
  explicit IdleDecisionEngine(const MonitorConfiguration& config);

  // Appends one decision per targeted record to decisions, in record order.
  // Records whose process is gone, is not targeted, or whose start time is
  // unknown produce no decision. now is in seconds since the epoch.
  void Evaluate(const vector<AcceleratorProcessRecord>& records,
                ProcessInfoSourceInterface* process_info_source,
                const vector<ContainerBinding>& bindings,
                time_t now,
                vector<IdleDecision>* decisions) const;
  // Single-record step of the above. Returns false if no decision results.
  bool EvaluateRecord(const AcceleratorProcessRecord& record,
                      ProcessInfoSourceInterface* process_info_source,
                      const vector<ContainerBinding>& bindings,
                      time_t now,
                      IdleDecision* decision) const;
  bool IsTargeted(const string& command_name) const;
  bool IsWhitelisted(const string& name) const;

 protected:
  FRIEND_TEST(IdleDecisionEngineTest, ContainerResolutionPicksFirstMatch);
  // Name of the first container whose root process is pid, or NULL.
  const string* ResolveContainerName(
      uint64_t pid, const vector<ContainerBinding>& bindings) const;

  const MonitorConfiguration config_;
};

}  // namespace nvidler

#endif  // NVIDLER_ENGINE_IDLE_DECISION_ENGINE_H
