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

// Miscellaneous utility functions. Descriptions with their declarations.

#ifndef NVIDLER_MISC_UTILS_H
#define NVIDLER_MISC_UTILS_H

#include <sys/types.h>
#include <time.h>

#include <string>
#include <vector>

#include "base/common.h"

namespace nvidler {

#ifdef OPEN_MAX
#define OPEN_MAX_GUESS OPEN_MAX
#else
#define OPEN_MAX_GUESS 256 // reasonable value
#endif

// Runs an external command to completion and captures its standard output.
// The command is killed if it has not finished within timeout_ms. Returns
// true only if the command exited normally with status zero; output holds
// whatever was captured in any case.
bool RunCommandWithTimeout(const string& binary, const vector<string>& args,
                           uint64_t timeout_ms, string* output);

// Parses a timestamp in the fixed format printed by "ps -o lstart", e.g.
// "Mon Jan  2 15:04:05 2006", interpreted in local time.
bool ParseLstartTimestamp(const string& text, time_t* timestamp);

// Inverse of the above, used for the startup banner.
string TimestampToLstartString(const time_t rawtime);

}  // namespace nvidler

#endif  // NVIDLER_MISC_UTILS_H
