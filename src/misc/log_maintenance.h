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

// Startup-time housekeeping for the monitor's log file.

#ifndef NVIDLER_MISC_LOG_MAINTENANCE_H
#define NVIDLER_MISC_LOG_MAINTENANCE_H

#include <time.h>

#include <string>

#include "base/common.h"

namespace nvidler {

// Moves an existing log file out of the way by renaming it to
// "<log_file>.1", replacing any previous rotation. Returns false if the file
// exists but could not be renamed.
bool RotateLogFile(const string& log_file);

// Deletes rotated copies of log_file, i.e. files in the same directory whose
// name starts with "<basename>.", that were last modified more than
// retention_days before now. Returns the number of files removed.
uint32_t PruneRotatedLogs(const string& log_file, uint32_t retention_days,
                          time_t now);

}  // namespace nvidler

#endif  // NVIDLER_MISC_LOG_MAINTENANCE_H
