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

// gmock doubles for the cycle's collaborators.

#ifndef NVIDLER_ENGINE_MOCK_SOURCES_H
#define NVIDLER_ENGINE_MOCK_SOURCES_H

#include "engine/accelerator_usage_source_interface.h"
#include "engine/container_identity_source_interface.h"
#include "engine/executors/action_executor_interface.h"
#include "engine/process_info_source_interface.h"
#include "engine/process_signaller_interface.h"

#include <gmock/gmock.h>

namespace nvidler {

class MockAcceleratorUsageSource : public AcceleratorUsageSourceInterface {
 public:
  MOCK_METHOD1(ListAcceleratorProcesses,
               bool(vector<AcceleratorProcessRecord>* records));
};

class MockProcessInfoSource : public ProcessInfoSourceInterface {
 public:
  MOCK_METHOD2(GetProcessInfo, bool(uint64_t pid, ProcessInfo* info));
};

class MockContainerIdentitySource : public ContainerIdentitySourceInterface {
 public:
  MOCK_METHOD1(ListContainerBindings,
               bool(vector<ContainerBinding>* bindings));
};

class MockProcessSignaller : public ProcessSignallerInterface {
 public:
  MOCK_METHOD1(SendTerminationSignal, bool(uint64_t pid));
};

class MockActionExecutor : public executor::ActionExecutorInterface {
 public:
  MOCK_METHOD1(Execute, bool(const IdleDecision& decision));
};

}  // namespace nvidler

#endif  // NVIDLER_ENGINE_MOCK_SOURCES_H
