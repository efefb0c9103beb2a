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

// LocalActionExecutor class unit tests.

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "base/common.h"
#include "engine/executors/local_action_executor.h"
#include "engine/mock_sources.h"

using ::testing::_;
using ::testing::Return;

namespace nvidler {
namespace executor {

// The fixture for testing class LocalActionExecutor.
class LocalActionExecutorTest : public ::testing::Test {
 protected:
  LocalActionExecutorTest() {
    FLAGS_v = 1;
  }

  IdleDecision MakeDecision(IdleDecision::Action action) {
    IdleDecision decision;
    decision.set_pid(1234);
    decision.set_command_name("python3");
    decision.set_idle_seconds(400);
    decision.set_action(action);
    decision.set_reason(action == IdleDecision::NONE
                        ? IdleDecision::ACTIVE
                        : IdleDecision::IDLE_OVER_THRESHOLD);
    return decision;
  }

  MockProcessSignaller signaller_;
};

TEST_F(LocalActionExecutorTest, NoActionSendsNoSignal) {
  LocalActionExecutor lae(&signaller_, 300);
  EXPECT_CALL(signaller_, SendTerminationSignal(_)).Times(0);
  EXPECT_TRUE(lae.Execute(MakeDecision(IdleDecision::NONE)));
}

TEST_F(LocalActionExecutorTest, WarningSendsNoSignal) {
  LocalActionExecutor lae(&signaller_, 300);
  EXPECT_CALL(signaller_, SendTerminationSignal(_)).Times(0);
  EXPECT_TRUE(lae.Execute(MakeDecision(IdleDecision::WARN)));
}

TEST_F(LocalActionExecutorTest, TerminateSignalsThePid) {
  LocalActionExecutor lae(&signaller_, 300);
  EXPECT_CALL(signaller_, SendTerminationSignal(1234)).WillOnce(Return(true));
  EXPECT_TRUE(lae.Execute(MakeDecision(IdleDecision::TERMINATE)));
}

// Delivery failures are reported, but do not throw or abort.
TEST_F(LocalActionExecutorTest, FailedTerminationIsReported) {
  LocalActionExecutor lae(&signaller_, 300);
  EXPECT_CALL(signaller_, SendTerminationSignal(1234))
      .WillOnce(Return(false));
  EXPECT_FALSE(lae.Execute(MakeDecision(IdleDecision::TERMINATE)));
}

TEST_F(LocalActionExecutorTest, DescriptionNamesContainer) {
  LocalActionExecutor lae(&signaller_, 300);
  IdleDecision decision = MakeDecision(IdleDecision::WARN);
  EXPECT_EQ(lae.DescribeIdleProcess(decision),
            "Process 1234 (python3) in Docker container <none> has been idle "
            "for 400 seconds (threshold 300 seconds).");
  decision.set_container_name("notebook");
  EXPECT_EQ(lae.DescribeIdleProcess(decision),
            "Process 1234 (python3) in Docker container notebook has been "
            "idle for 400 seconds (threshold 300 seconds).");
}

}  // namespace executor
}  // namespace nvidler

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  nvidler::common::InitNvidler(argc, argv);
  return RUN_ALL_TESTS();
}
