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

// String tool unit tests.

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "base/common.h"
#include "misc/string_utils.h"

namespace nvidler {

TEST(StringUtilsTest, SplitDropsBlankEntries) {
  vector<string> entries = SplitCommaSeparatedList(" python, ,cuda ,,");
  ASSERT_EQ(entries.size(), 2UL);
  EXPECT_EQ(entries[0], "python");
  EXPECT_EQ(entries[1], "cuda");
  EXPECT_TRUE(SplitCommaSeparatedList("").empty());
}

TEST(StringUtilsTest, SubstringMatching) {
  vector<string> needles;
  needles.push_back("python");
  needles.push_back("torch");
  EXPECT_TRUE(ContainsAnySubstring("python3", needles));
  EXPECT_TRUE(ContainsAnySubstring("libtorch_run", needles));
  EXPECT_FALSE(ContainsAnySubstring("pyth", needles));
  EXPECT_FALSE(ContainsAnySubstring("bash", vector<string>()));
}

// An empty entry would otherwise match everything.
TEST(StringUtilsTest, EmptyNeedleMatchesNothing) {
  vector<string> needles;
  needles.push_back("");
  EXPECT_FALSE(ContainsAnySubstring("python", needles));
}

TEST(StringUtilsTest, ExactMatching) {
  vector<string> entries;
  entries.push_back("training-job");
  EXPECT_TRUE(MatchesAnyExactly("training-job", entries));
  EXPECT_FALSE(MatchesAnyExactly("training-job-2", entries));
  EXPECT_FALSE(MatchesAnyExactly("training", entries));
}

TEST(StringUtilsTest, StripLeadingSlash) {
  EXPECT_EQ(StripLeadingSlash("/notebook"), "notebook");
  EXPECT_EQ(StripLeadingSlash("notebook"), "notebook");
  EXPECT_EQ(StripLeadingSlash(""), "");
}

}  // namespace nvidler

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  nvidler::common::InitNvidler(argc, argv);
  return RUN_ALL_TESTS();
}
