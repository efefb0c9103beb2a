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

// DockerContainerSource class unit tests.

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "base/common.h"
#include "engine/docker_container_source.h"

using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgPointee;

namespace nvidler {

class MockUnixSocketHttpClient : public UnixSocketHttpClient {
 public:
  MockUnixSocketHttpClient() : UnixSocketHttpClient("/nonexistent", 1000) {}
  MOCK_METHOD2(Get, bool(const string& request_path, string* body));
};

static const char kContainerList[] =
    "[{\"Id\": \"aaaa1111\", \"Names\": [\"/training-job\"], "
    "\"State\": \"running\"},"
    " {\"Id\": \"bbbb2222\", \"Names\": [\"/notebook\", \"/alias\"]}]";

// The fixture for testing class DockerContainerSource.
class DockerContainerSourceTest : public ::testing::Test {
 protected:
  DockerContainerSourceTest() {
    FLAGS_v = 1;
  }

  string InspectResponse(int64_t pid) {
    return "{\"Id\": \"x\", \"State\": {\"Status\": \"running\", \"Pid\": " +
           to_string(pid) + "}}";
  }

  MockUnixSocketHttpClient client_;
};

TEST_F(DockerContainerSourceTest, ParsesContainerList) {
  vector<ContainerBinding> containers;
  ASSERT_TRUE(DockerContainerSource::ParseContainerList(kContainerList,
                                                        &containers));
  ASSERT_EQ(containers.size(), 2UL);
  EXPECT_EQ(containers[0].container_id(), "aaaa1111");
  EXPECT_EQ(containers[0].container_name(), "training-job");
  EXPECT_EQ(containers[1].container_name(), "notebook");
}

TEST_F(DockerContainerSourceTest, EmptyContainerListIsValid) {
  vector<ContainerBinding> containers;
  EXPECT_TRUE(DockerContainerSource::ParseContainerList("[]", &containers));
  EXPECT_TRUE(containers.empty());
}

TEST_F(DockerContainerSourceTest, RejectsMalformedContainerList) {
  vector<ContainerBinding> containers;
  EXPECT_FALSE(DockerContainerSource::ParseContainerList("not json",
                                                         &containers));
  EXPECT_FALSE(DockerContainerSource::ParseContainerList(
      "{\"message\": \"server error\"}", &containers));
  EXPECT_FALSE(DockerContainerSource::ParseContainerList(
      "[{\"Names\": [\"/no-id\"]}]", &containers));
}

// IDs are used to build request paths, so only hex IDs are accepted.
TEST_F(DockerContainerSourceTest, SkipsContainersWithOddIds) {
  vector<ContainerBinding> containers;
  ASSERT_TRUE(DockerContainerSource::ParseContainerList(
      "[{\"Id\": \"../../x\", \"Names\": [\"/evil\"]},"
      " {\"Id\": \"cc33\", \"Names\": [\"/ok\"]}]", &containers));
  ASSERT_EQ(containers.size(), 1UL);
  EXPECT_EQ(containers[0].container_name(), "ok");
}

TEST_F(DockerContainerSourceTest, ParsesInspectRootPid) {
  uint64_t root_pid = 0;
  ASSERT_TRUE(DockerContainerSource::ParseInspectRootPid(InspectResponse(4321),
                                                         &root_pid));
  EXPECT_EQ(root_pid, 4321U);
  EXPECT_FALSE(DockerContainerSource::ParseInspectRootPid("{}", &root_pid));
  EXPECT_FALSE(DockerContainerSource::ParseInspectRootPid(
      InspectResponse(-1), &root_pid));
}

TEST_F(DockerContainerSourceTest, ResolvesDockerSocket) {
  string socket_path;
  ASSERT_TRUE(DockerContainerSource::ResolveDockerSocket(
      NULL, "/var/run/docker.sock", &socket_path));
  EXPECT_EQ(socket_path, "/var/run/docker.sock");
  ASSERT_TRUE(DockerContainerSource::ResolveDockerSocket(
      "", "/var/run/docker.sock", &socket_path));
  EXPECT_EQ(socket_path, "/var/run/docker.sock");
  ASSERT_TRUE(DockerContainerSource::ResolveDockerSocket(
      "unix:///run/user/1000/docker.sock", "/var/run/docker.sock",
      &socket_path));
  EXPECT_EQ(socket_path, "/run/user/1000/docker.sock");
  EXPECT_FALSE(DockerContainerSource::ResolveDockerSocket(
      "tcp://10.0.0.1:2375", "/var/run/docker.sock", &socket_path));
}

TEST_F(DockerContainerSourceTest, ListsBindings) {
  EXPECT_CALL(client_, Get("/containers/json", _))
      .WillOnce(DoAll(SetArgPointee<1>(string(kContainerList)),
                      Return(true)));
  EXPECT_CALL(client_, Get("/containers/aaaa1111/json", _))
      .WillOnce(DoAll(SetArgPointee<1>(InspectResponse(1234)), Return(true)));
  EXPECT_CALL(client_, Get("/containers/bbbb2222/json", _))
      .WillOnce(DoAll(SetArgPointee<1>(InspectResponse(5678)), Return(true)));
  DockerContainerSource source(&client_);
  vector<ContainerBinding> bindings;
  ASSERT_TRUE(source.ListContainerBindings(&bindings));
  ASSERT_EQ(bindings.size(), 2UL);
  EXPECT_EQ(bindings[0].container_name(), "training-job");
  EXPECT_EQ(bindings[0].root_pid(), 1234U);
  EXPECT_EQ(bindings[1].container_name(), "notebook");
  EXPECT_EQ(bindings[1].root_pid(), 5678U);
}

// A container that cannot be inspected (e.g. removed in the meantime) is
// dropped; the others are still reported.
TEST_F(DockerContainerSourceTest, SkipsContainersThatFailInspection) {
  EXPECT_CALL(client_, Get("/containers/json", _))
      .WillOnce(DoAll(SetArgPointee<1>(string(kContainerList)),
                      Return(true)));
  EXPECT_CALL(client_, Get("/containers/aaaa1111/json", _))
      .WillOnce(Return(false));
  EXPECT_CALL(client_, Get("/containers/bbbb2222/json", _))
      .WillOnce(DoAll(SetArgPointee<1>(InspectResponse(5678)), Return(true)));
  DockerContainerSource source(&client_);
  vector<ContainerBinding> bindings;
  ASSERT_TRUE(source.ListContainerBindings(&bindings));
  ASSERT_EQ(bindings.size(), 1UL);
  EXPECT_EQ(bindings[0].container_name(), "notebook");
}

// Stopped containers report a PID of 0 and have no root process to match.
TEST_F(DockerContainerSourceTest, SkipsContainersWithoutRootProcess) {
  EXPECT_CALL(client_, Get("/containers/json", _))
      .WillOnce(DoAll(SetArgPointee<1>(string(kContainerList)),
                      Return(true)));
  EXPECT_CALL(client_, Get("/containers/aaaa1111/json", _))
      .WillOnce(DoAll(SetArgPointee<1>(InspectResponse(0)), Return(true)));
  EXPECT_CALL(client_, Get("/containers/bbbb2222/json", _))
      .WillOnce(DoAll(SetArgPointee<1>(InspectResponse(5678)), Return(true)));
  DockerContainerSource source(&client_);
  vector<ContainerBinding> bindings;
  ASSERT_TRUE(source.ListContainerBindings(&bindings));
  ASSERT_EQ(bindings.size(), 1UL);
  EXPECT_EQ(bindings[0].root_pid(), 5678U);
}

TEST_F(DockerContainerSourceTest, ListFailureIsReported) {
  EXPECT_CALL(client_, Get("/containers/json", _)).WillOnce(Return(false));
  DockerContainerSource source(&client_);
  vector<ContainerBinding> bindings;
  EXPECT_FALSE(source.ListContainerBindings(&bindings));
  EXPECT_TRUE(bindings.empty());
}

TEST_F(DockerContainerSourceTest, Ping) {
  EXPECT_CALL(client_, Get("/_ping", _))
      .WillOnce(DoAll(SetArgPointee<1>(string("OK")), Return(true)))
      .WillOnce(Return(false));
  DockerContainerSource source(&client_);
  EXPECT_TRUE(source.Ping());
  EXPECT_FALSE(source.Ping());
}

}  // namespace nvidler

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  nvidler::common::InitNvidler(argc, argv);
  return RUN_ALL_TESTS();
}
