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

// NvidiaSmiUsageSource class unit tests.

#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "base/common.h"
#include "base/units.h"
#include "engine/nvidia_smi_usage_source.h"

namespace nvidler {

// The fixture for testing class NvidiaSmiUsageSource.
class NvidiaSmiUsageSourceTest : public ::testing::Test {
 protected:
  NvidiaSmiUsageSourceTest() {
    FLAGS_v = 1;
  }

  virtual void SetUp() {
    char dir_template[] = "/tmp/nvidler_nvsmi_XXXXXX";
    char* dir = mkdtemp(dir_template);
    ASSERT_TRUE(dir != NULL);
    tmp_dir_ = dir;
  }

  virtual void TearDown() {
    if (!fake_tool_.empty())
      unlink(fake_tool_.c_str());
    rmdir(tmp_dir_.c_str());
  }

  // Writes an executable shell script standing in for the query tool.
  string WriteFakeTool(const string& script_body) {
    fake_tool_ = tmp_dir_ + "/nvidia-smi";
    ofstream script(fake_tool_.c_str());
    script << "#!/bin/sh\n" << script_body << "\n";
    script.close();
    chmod(fake_tool_.c_str(), 0755);
    return fake_tool_;
  }

  string tmp_dir_;
  string fake_tool_;
};

TEST_F(NvidiaSmiUsageSourceTest, ParsesComputeApps) {
  vector<AcceleratorProcessRecord> records;
  EXPECT_EQ(NvidiaSmiUsageSource::ParseComputeAppsCsv(
      "1234, 0\n5678, 512\n", &records), 0U);
  ASSERT_EQ(records.size(), 2UL);
  EXPECT_EQ(records[0].pid(), 1234U);
  EXPECT_EQ(records[0].used_memory_bytes(), 0U);
  EXPECT_EQ(records[1].pid(), 5678U);
  EXPECT_EQ(records[1].used_memory_bytes(), 512 * MB_TO_BYTES);
}

TEST_F(NvidiaSmiUsageSourceTest, EmptyOutputMeansNoProcesses) {
  vector<AcceleratorProcessRecord> records;
  EXPECT_EQ(NvidiaSmiUsageSource::ParseComputeAppsCsv("", &records), 0U);
  EXPECT_EQ(NvidiaSmiUsageSource::ParseComputeAppsCsv("\n  \n", &records),
            0U);
  EXPECT_TRUE(records.empty());
}

// Bad lines are dropped without affecting the good ones around them.
TEST_F(NvidiaSmiUsageSourceTest, SkipsMalformedLines) {
  vector<AcceleratorProcessRecord> records;
  string output = "1234,0\n"
                  "garbage\n"
                  "1,2,3\n"
                  "abc,10\n"
                  "42,[N/A]\n"
                  "-5,0\n"
                  "0,0\n"
                  "99999999999,0\n"
                  ",0\n"
                  "77 , 3\r\n";
  EXPECT_EQ(NvidiaSmiUsageSource::ParseComputeAppsCsv(output, &records), 8U);
  ASSERT_EQ(records.size(), 2UL);
  EXPECT_EQ(records[0].pid(), 1234U);
  EXPECT_EQ(records[1].pid(), 77U);
  EXPECT_EQ(records[1].used_memory_bytes(), 3 * MB_TO_BYTES);
}

// Memory figures too large to express in bytes are rejected rather than
// wrapped, so a busy process can never appear to use no memory.
TEST_F(NvidiaSmiUsageSourceTest, RejectsMemoryUseOverflowingBytes) {
  vector<AcceleratorProcessRecord> records;
  EXPECT_EQ(NvidiaSmiUsageSource::ParseComputeAppsCsv(
      "1234, 17592186044416\n5678, 17592186044415\n", &records), 1U);
  ASSERT_EQ(records.size(), 1UL);
  EXPECT_EQ(records[0].pid(), 5678U);
  EXPECT_EQ(records[0].used_memory_bytes(), 17592186044415ULL * MB_TO_BYTES);
  EXPECT_NE(records[0].used_memory_bytes(), 0U);
}

TEST_F(NvidiaSmiUsageSourceTest, RunsQueryTool) {
  string tool = WriteFakeTool(
      "[ \"$1\" = \"--query-compute-apps=pid,used_memory\" ] || exit 3\n"
      "[ \"$2\" = \"--format=csv,noheader,nounits\" ] || exit 4\n"
      "echo '1234, 0'\n"
      "echo '4321, 100'");
  NvidiaSmiUsageSource source(tool, 5000);
  vector<AcceleratorProcessRecord> records;
  ASSERT_TRUE(source.ListAcceleratorProcesses(&records));
  ASSERT_EQ(records.size(), 2UL);
  EXPECT_EQ(records[0].pid(), 1234U);
  EXPECT_EQ(records[1].used_memory_bytes(), 100 * MB_TO_BYTES);
}

TEST_F(NvidiaSmiUsageSourceTest, ToolFailureFailsSnapshot) {
  string tool = WriteFakeTool("echo 'NVIDIA-SMI has failed'\nexit 9");
  NvidiaSmiUsageSource source(tool, 5000);
  vector<AcceleratorProcessRecord> records;
  EXPECT_FALSE(source.ListAcceleratorProcesses(&records));
  EXPECT_TRUE(records.empty());
}

TEST_F(NvidiaSmiUsageSourceTest, MissingToolFailsSnapshot) {
  NvidiaSmiUsageSource source(tmp_dir_ + "/does-not-exist", 5000);
  vector<AcceleratorProcessRecord> records;
  EXPECT_FALSE(source.ListAcceleratorProcesses(&records));
}

TEST_F(NvidiaSmiUsageSourceTest, HungToolTimesOut) {
  string tool = WriteFakeTool("exec sleep 30");
  NvidiaSmiUsageSource source(tool, 200);
  vector<AcceleratorProcessRecord> records;
  EXPECT_FALSE(source.ListAcceleratorProcesses(&records));
}

}  // namespace nvidler

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  nvidler::common::InitNvidler(argc, argv);
  return RUN_ALL_TESTS();
}
