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

// Container identity source backed by the Docker Engine API. Lists running
// containers and inspects each of them for its root process.

#ifndef NVIDLER_ENGINE_DOCKER_CONTAINER_SOURCE_H
#define NVIDLER_ENGINE_DOCKER_CONTAINER_SOURCE_H

#include "engine/container_identity_source_interface.h"

#include <string>
#include <vector>

#include "base/common.h"
#include "base/types.h"
#include "platforms/unix/unix_socket_http_client.h"

namespace nvidler {

using platform_unix::UnixSocketHttpClient;

class DockerContainerSource : public ContainerIdentitySourceInterface {
 public:
  // The client is not owned.
  explicit DockerContainerSource(UnixSocketHttpClient* client);
  bool ListContainerBindings(vector<ContainerBinding>* bindings);
  // Checks that the daemon answers; used for a startup diagnostic only.
  bool Ping();

  // Picks the API socket the way the Docker CLI does: a unix:// DOCKER_HOST
  // wins over the default. Other transports are not supported.
  static bool ResolveDockerSocket(const char* docker_host,
                                  const string& default_socket,
                                  string* socket_path);
  // Extracts ID and primary name (without the leading '/') of every
  // container in a /containers/json response, in response order.
  static bool ParseContainerList(const string& json,
                                 vector<ContainerBinding>* containers);
  // Extracts State.Pid from a /containers/<id>/json response.
  static bool ParseInspectRootPid(const string& json, uint64_t* root_pid);

 private:
  UnixSocketHttpClient* client_;
};

}  // namespace nvidler

#endif  // NVIDLER_ENGINE_DOCKER_CONTAINER_SOURCE_H
