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

#include "engine/docker_container_source.h"

#include <sstream>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "misc/string_utils.h"

namespace nvidler {

using boost::property_tree::ptree;

DockerContainerSource::DockerContainerSource(UnixSocketHttpClient* client)
  : client_(client) {
  CHECK_NOTNULL(client_);
}

bool DockerContainerSource::ListContainerBindings(
    vector<ContainerBinding>* bindings) {
  CHECK_NOTNULL(bindings);
  bindings->clear();
  string body;
  if (!client_->Get("/containers/json", &body)) {
    LOG(WARNING) << "Failed to get Docker container list.";
    return false;
  }
  vector<ContainerBinding> containers;
  if (!ParseContainerList(body, &containers)) {
    LOG(WARNING) << "Failed to parse Docker container list.";
    return false;
  }
  for (vector<ContainerBinding>::iterator it = containers.begin();
       it != containers.end();
       ++it) {
    string inspect_body;
    uint64_t root_pid = 0;
    if (!client_->Get("/containers/" + it->container_id() + "/json",
                      &inspect_body) ||
        !ParseInspectRootPid(inspect_body, &root_pid)) {
      LOG(WARNING) << "Failed to inspect container: " << it->container_id();
      continue;
    }
    if (root_pid == 0) {
      VLOG(1) << "Container " << it->container_name() << " has no running "
              << "root process; ignoring it.";
      continue;
    }
    it->set_root_pid(root_pid);
    VLOG(1) << "Docker container " << it->container_name() << " has root PID "
            << root_pid;
    bindings->push_back(*it);
  }
  return true;
}

bool DockerContainerSource::Ping() {
  string body;
  if (!client_->Get("/_ping", &body))
    return false;
  return boost::trim_copy(body) == "OK";
}

bool DockerContainerSource::ResolveDockerSocket(const char* docker_host,
                                                const string& default_socket,
                                                string* socket_path) {
  if (docker_host == NULL || *docker_host == '\0') {
    *socket_path = default_socket;
    return !socket_path->empty();
  }
  string host(docker_host);
  const string unix_scheme = "unix://";
  if (!boost::starts_with(host, unix_scheme)) {
    LOG(ERROR) << "Unsupported DOCKER_HOST '" << host << "'; only unix:// "
               << "sockets are supported.";
    return false;
  }
  *socket_path = host.substr(unix_scheme.size());
  return !socket_path->empty();
}

bool DockerContainerSource::ParseContainerList(
    const string& json, vector<ContainerBinding>* containers) {
  ptree root;
  try {
    stringstream ss(json);
    boost::property_tree::read_json(ss, root);
    for (ptree::const_iterator it = root.begin(); it != root.end(); ++it) {
      // Array elements have empty keys; anything else is an error object.
      if (!it->first.empty())
        return false;
      const ptree& container = it->second;
      string id = container.get<string>("Id");
      if (id.empty() || !boost::algorithm::all(id, boost::is_xdigit())) {
        LOG(WARNING) << "Ignoring container with unexpected ID '" << id
                     << "'";
        continue;
      }
      string name = id;
      boost::optional<const ptree&> names =
          container.get_child_optional("Names");
      if (names && !names->empty())
        name = StripLeadingSlash(names->begin()->second.get_value<string>());
      ContainerBinding binding;
      binding.set_container_id(id);
      binding.set_container_name(name);
      containers->push_back(binding);
    }
  } catch (const boost::property_tree::ptree_error& e) {
    LOG(WARNING) << "Unparseable container list: " << e.what();
    return false;
  }
  return true;
}

bool DockerContainerSource::ParseInspectRootPid(const string& json,
                                                uint64_t* root_pid) {
  ptree root;
  try {
    stringstream ss(json);
    boost::property_tree::read_json(ss, root);
    int64_t pid = root.get<int64_t>("State.Pid");
    if (pid < 0)
      return false;
    *root_pid = static_cast<uint64_t>(pid);
  } catch (const boost::property_tree::ptree_error& e) {
    LOG(WARNING) << "Unparseable container inspect response: " << e.what();
    return false;
  }
  return true;
}

}  // namespace nvidler
