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

// Snapshot of running containers' root processes.

#ifndef NVIDLER_ENGINE_CONTAINER_IDENTITY_SOURCE_INTERFACE_H
#define NVIDLER_ENGINE_CONTAINER_IDENTITY_SOURCE_INTERFACE_H

#include <vector>

#include "base/common.h"
#include "base/types.h"

namespace nvidler {

class ContainerIdentitySourceInterface {
 public:
  virtual ~ContainerIdentitySourceInterface() {}
  // Replaces the contents of bindings with one entry per running container,
  // in the order the container runtime enumerates them. Returns false if the
  // container list itself could not be obtained.
  virtual bool ListContainerBindings(vector<ContainerBinding>* bindings) = 0;
};

}  // namespace nvidler

#endif  // NVIDLER_ENGINE_CONTAINER_IDENTITY_SOURCE_INTERFACE_H
