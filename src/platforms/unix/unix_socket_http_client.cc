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

#include "platforms/unix/unix_socket_http_client.h"

#include <iterator>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>
#include <boost/bind.hpp>
#include <boost/lexical_cast.hpp>

namespace nvidler {
namespace platform_unix {

using boost::asio::io_service;
using boost::asio::local::stream_protocol;

namespace {

// Upper bound on the size of a response we are willing to buffer.
const size_t kMaxResponseBytes = 16 * 1024 * 1024;

void HandleDeadline(const boost::system::error_code& ec,
                    stream_protocol::socket* socket,
                    bool* timed_out) {
  if (ec == boost::asio::error::operation_aborted)
    return;
  *timed_out = true;
  boost::system::error_code ignored;
  socket->close(ignored);
}

void HandleConnect(const boost::system::error_code& ec,
                   boost::system::error_code* result) {
  *result = ec;
}

void HandleTransfer(const boost::system::error_code& ec,
                    size_t bytes_transferred,
                    boost::system::error_code* result) {
  *result = ec;
}

// Runs handlers until the operation tracked by ec has completed.
void RunUntilComplete(io_service* service, boost::system::error_code* ec) {
  while (*ec == boost::asio::error::would_block) {
    if (service->run_one() == 0) {
      *ec = boost::asio::error::operation_aborted;
      break;
    }
  }
}

}  // namespace

UnixSocketHttpClient::UnixSocketHttpClient(const string& socket_path,
                                           uint64_t timeout_ms)
  : socket_path_(socket_path),
    timeout_ms_(timeout_ms) {
  VLOG(1) << "HTTP client for unix:" << socket_path_ << " set up, timeout "
          << timeout_ms_ << " ms.";
}

UnixSocketHttpClient::~UnixSocketHttpClient() {
}

bool UnixSocketHttpClient::Get(const string& request_path, string* body) {
  CHECK_NOTNULL(body);
  io_service service;
  stream_protocol::socket socket(service);
  boost::asio::deadline_timer deadline(service);
  bool timed_out = false;
  deadline.expires_from_now(boost::posix_time::milliseconds(
      static_cast<int64_t>(timeout_ms_)));
  deadline.async_wait(boost::bind(&HandleDeadline,
                                  boost::asio::placeholders::error,
                                  &socket, &timed_out));

  boost::system::error_code ec = boost::asio::error::would_block;
  socket.async_connect(stream_protocol::endpoint(socket_path_),
                       boost::bind(&HandleConnect,
                                   boost::asio::placeholders::error, &ec));
  RunUntilComplete(&service, &ec);
  if (ec || timed_out) {
    LOG(WARNING) << "Failed to connect to unix:" << socket_path_ << ": "
                 << (timed_out ? "timed out" : ec.message());
    return false;
  }

  string request = "GET " + request_path + " HTTP/1.0\r\n"
                   "Host: localhost\r\n"
                   "Accept: application/json\r\n\r\n";
  ec = boost::asio::error::would_block;
  boost::asio::async_write(socket, boost::asio::buffer(request),
                           boost::bind(&HandleTransfer,
                                       boost::asio::placeholders::error,
                                       boost::asio::placeholders::
                                           bytes_transferred,
                                       &ec));
  RunUntilComplete(&service, &ec);
  if (ec || timed_out) {
    LOG(WARNING) << "Failed to send request for " << request_path << " to "
                 << "unix:" << socket_path_ << ": "
                 << (timed_out ? "timed out" : ec.message());
    return false;
  }

  // HTTP/1.0: the server closes the connection after the response.
  boost::asio::streambuf response_buf(kMaxResponseBytes);
  ec = boost::asio::error::would_block;
  boost::asio::async_read(socket, response_buf,
                          boost::asio::transfer_all(),
                          boost::bind(&HandleTransfer,
                                      boost::asio::placeholders::error,
                                      boost::asio::placeholders::
                                          bytes_transferred,
                                      &ec));
  RunUntilComplete(&service, &ec);
  if (timed_out || (ec && ec != boost::asio::error::eof)) {
    LOG(WARNING) << "Failed to read response for " << request_path
                 << " from unix:" << socket_path_ << ": "
                 << (timed_out ? "timed out" : ec.message());
    return false;
  }
  deadline.cancel();

  string response((std::istreambuf_iterator<char>(&response_buf)),
                  std::istreambuf_iterator<char>());
  uint32_t status_code = 0;
  if (!ParseHttpResponse(response, &status_code, body)) {
    LOG(WARNING) << "Malformed HTTP response for " << request_path;
    return false;
  }
  if (status_code < 200 || status_code >= 300) {
    LOG(WARNING) << "GET " << request_path << " returned HTTP status "
                 << status_code;
    return false;
  }
  return true;
}

bool UnixSocketHttpClient::ParseHttpResponse(const string& response,
                                             uint32_t* status_code,
                                             string* body) {
  size_t header_end = response.find("\r\n\r\n");
  if (header_end == string::npos)
    return false;
  size_t status_line_end = response.find("\r\n");
  string status_line = response.substr(0, status_line_end);
  vector<string> parts;
  boost::split(parts, status_line, boost::is_any_of(" "),
               boost::token_compress_on);
  if (parts.size() < 2 || !boost::starts_with(parts[0], "HTTP/"))
    return false;
  try {
    *status_code = boost::lexical_cast<uint32_t>(parts[1]);
  } catch (const boost::bad_lexical_cast& e) {
    return false;
  }
  *body = response.substr(header_end + 4);
  return true;
}

}  // namespace platform_unix
}  // namespace nvidler
