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

// Utility function unit tests.

#include <string.h>
#include <time.h>

#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <gtest/gtest.h>

#include "base/common.h"
#include "misc/utils.h"

namespace nvidler {

// The fixture for testing class Utils.
class UtilsTest : public ::testing::Test {
 protected:
  UtilsTest() {
    // You can do set-up work for each test here.
  }

  virtual ~UtilsTest() {
    // You can do clean-up work that doesn't throw exceptions here.
  }

  // Objects declared here can be used by all tests in the test case for
  // Utils.
};

TEST_F(UtilsTest, RunCommandCapturesOutput) {
  vector<string> args;
  args.push_back("hello");
  args.push_back("world");
  string output;
  ASSERT_TRUE(RunCommandWithTimeout("echo", args, 5000, &output));
  EXPECT_EQ(output, "hello world\n");
}

TEST_F(UtilsTest, RunCommandReportsNonZeroExit) {
  vector<string> args;
  string output;
  EXPECT_FALSE(RunCommandWithTimeout("false", args, 5000, &output));
}

TEST_F(UtilsTest, RunCommandReportsMissingBinary) {
  vector<string> args;
  string output;
  EXPECT_FALSE(RunCommandWithTimeout("/nonexistent/nvidler-test-binary",
                                     args, 5000, &output));
}

// A hung command is killed once the timeout expires, well before it would
// have finished by itself.
TEST_F(UtilsTest, RunCommandKillsHungCommand) {
  vector<string> args;
  args.push_back("30");
  string output;
  boost::posix_time::ptime start =
      boost::posix_time::microsec_clock::universal_time();
  EXPECT_FALSE(RunCommandWithTimeout("sleep", args, 200, &output));
  boost::posix_time::time_duration elapsed =
      boost::posix_time::microsec_clock::universal_time() - start;
  EXPECT_LT(elapsed.total_seconds(), 10);
}

TEST_F(UtilsTest, ParseLstartTimestamp) {
  struct tm expected_tm;
  memset(&expected_tm, 0, sizeof(expected_tm));
  expected_tm.tm_year = 2006 - 1900;
  expected_tm.tm_mon = 0;
  expected_tm.tm_mday = 2;
  expected_tm.tm_hour = 15;
  expected_tm.tm_min = 4;
  expected_tm.tm_sec = 5;
  expected_tm.tm_isdst = -1;
  time_t expected = mktime(&expected_tm);
  time_t parsed = 0;
  ASSERT_TRUE(ParseLstartTimestamp("Mon Jan  2 15:04:05 2006\n", &parsed));
  EXPECT_EQ(parsed, expected);
}

TEST_F(UtilsTest, ParseLstartTimestampRejectsGarbage) {
  time_t parsed = 0;
  EXPECT_FALSE(ParseLstartTimestamp("", &parsed));
  EXPECT_FALSE(ParseLstartTimestamp("yesterday", &parsed));
  EXPECT_FALSE(ParseLstartTimestamp("Mon Jan  2 15:04:05 2006 extra",
                                    &parsed));
}

TEST_F(UtilsTest, LstartStringParsesBack) {
  time_t now = 1700000000;
  time_t parsed = 0;
  ASSERT_TRUE(ParseLstartTimestamp(TimestampToLstartString(now), &parsed));
  EXPECT_EQ(parsed, now);
}

}  // namespace nvidler

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  nvidler::common::InitNvidler(argc, argv);
  return RUN_ALL_TESTS();
}
