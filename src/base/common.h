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

// Common static data structures and methods.

#ifndef NVIDLER_BASE_COMMON_H
#define NVIDLER_BASE_COMMON_H

#include <stdint.h>

#include <sstream>  // NOLINT
#include <vector>
#include <set>
#include <string>
#include <limits>

#include <glog/logging.h>
#include <gflags/gflags.h>
#include <gtest/gtest_prod.h>

namespace nvidler {

using namespace std;  // NOLINT

namespace common {

// Helper function to perform common init tasks for the nvidler binary and its
// unit tests.
inline void InitNvidler(int argc, char *argv[]) {
  // The monitor always mirrors its log to the console; the log file is
  // attached separately as a sink. --nologtostderr still wins if given.
  google::SetCommandLineOptionWithMode("logtostderr", "true",
                                       google::SET_FLAGS_DEFAULT);
  // Flags are re-arranged rather than removed, so that argv stays intact for
  // the gtest runner that may have consumed some of it already.
  google::ParseCommandLineFlags(&argc, &argv, false);

  // Set up glog for logging output
  google::InitGoogleLogging(argv[0]);
}

}  // namespace common
}  // namespace nvidler

#endif  // NVIDLER_BASE_COMMON_H
