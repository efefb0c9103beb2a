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

// Minimal blocking HTTP client for local services listening on UNIX domain
// sockets, such as the Docker Engine API. Every request is bounded by a
// timeout.

#ifndef NVIDLER_PLATFORMS_UNIX_UNIX_SOCKET_HTTP_CLIENT_H
#define NVIDLER_PLATFORMS_UNIX_UNIX_SOCKET_HTTP_CLIENT_H

#include <string>

#include <boost/noncopyable.hpp>

#include "base/common.h"

namespace nvidler {
namespace platform_unix {

class UnixSocketHttpClient : private boost::noncopyable {
 public:
  UnixSocketHttpClient(const string& socket_path, uint64_t timeout_ms);
  virtual ~UnixSocketHttpClient();
  // Issues "GET request_path" and stores the response body. Returns false on
  // connection errors, timeouts and non-2xx responses.
  virtual bool Get(const string& request_path, string* body);
  const string& socket_path() const { return socket_path_; }

  // Splits a raw HTTP/1.x response into status code and body.
  static bool ParseHttpResponse(const string& response, uint32_t* status_code,
                                string* body);

 private:
  const string socket_path_;
  const uint64_t timeout_ms_;
};

}  // namespace platform_unix
}  // namespace nvidler

#endif  // NVIDLER_PLATFORMS_UNIX_UNIX_SOCKET_HTTP_CLIENT_H
