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

// The interface through which the cycle scheduler enacts idle decisions.

#ifndef NVIDLER_ENGINE_EXECUTORS_ACTION_EXECUTOR_INTERFACE_H
#define NVIDLER_ENGINE_EXECUTORS_ACTION_EXECUTOR_INTERFACE_H

#include "base/common.h"
#include "base/types.h"

namespace nvidler {
namespace executor {

class ActionExecutorInterface {
 public:
  virtual ~ActionExecutorInterface() {}
  // Carries out the decision's action. Returns false if the action failed;
  // failures are logged by the executor and are never fatal.
  virtual bool Execute(const IdleDecision& decision) = 0;
};

}  // namespace executor
}  // namespace nvidler

#endif  // NVIDLER_ENGINE_EXECUTORS_ACTION_EXECUTOR_INTERFACE_H
