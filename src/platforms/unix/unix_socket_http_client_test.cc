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

// UNIX domain socket HTTP client unit tests.

#include <string>

#include <gtest/gtest.h>

#include "base/common.h"
#include "platforms/unix/unix_socket_http_client.h"

namespace nvidler {
namespace platform_unix {

TEST(UnixSocketHttpClientTest, ParsesResponse) {
  uint32_t status = 0;
  string body;
  ASSERT_TRUE(UnixSocketHttpClient::ParseHttpResponse(
      "HTTP/1.0 200 OK\r\nContent-Type: application/json\r\n\r\n[]",
      &status, &body));
  EXPECT_EQ(status, 200U);
  EXPECT_EQ(body, "[]");
}

TEST(UnixSocketHttpClientTest, ParsesErrorResponse) {
  uint32_t status = 0;
  string body;
  ASSERT_TRUE(UnixSocketHttpClient::ParseHttpResponse(
      "HTTP/1.1 404 Not Found\r\n\r\n{\"message\":\"No such container\"}",
      &status, &body));
  EXPECT_EQ(status, 404U);
  EXPECT_EQ(body, "{\"message\":\"No such container\"}");
}

TEST(UnixSocketHttpClientTest, RejectsMalformedResponse) {
  uint32_t status = 0;
  string body;
  EXPECT_FALSE(UnixSocketHttpClient::ParseHttpResponse("", &status, &body));
  EXPECT_FALSE(UnixSocketHttpClient::ParseHttpResponse(
      "HTTP/1.0 200 OK\r\n", &status, &body));
  EXPECT_FALSE(UnixSocketHttpClient::ParseHttpResponse(
      "SSH-2.0-OpenSSH\r\n\r\n", &status, &body));
  EXPECT_FALSE(UnixSocketHttpClient::ParseHttpResponse(
      "HTTP/1.0 abc OK\r\n\r\n", &status, &body));
}

// Nothing listens on this path, so the request fails rather than hangs.
TEST(UnixSocketHttpClientTest, MissingSocketFails) {
  UnixSocketHttpClient client("/nonexistent/nvidler-test.sock", 1000);
  string body;
  EXPECT_FALSE(client.Get("/_ping", &body));
}

}  // namespace platform_unix
}  // namespace nvidler

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  nvidler::common::InitNvidler(argc, argv);
  return RUN_ALL_TESTS();
}
