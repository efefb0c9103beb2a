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

#include "misc/log_maintenance.h"

#include <string>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>

#include "base/units.h"

namespace nvidler {

namespace fs = boost::filesystem;

bool RotateLogFile(const string& log_file) {
  boost::system::error_code ec;
  fs::path log_path(log_file);
  if (!fs::exists(log_path, ec))
    return true;
  fs::path rotated_path(log_file + ".1");
  fs::rename(log_path, rotated_path, ec);
  if (ec) {
    LOG(ERROR) << "Failed to rotate log file " << log_file << " to "
               << rotated_path.string() << ": " << ec.message();
    return false;
  }
  VLOG(1) << "Rotated log file " << log_file << " to "
          << rotated_path.string();
  return true;
}

uint32_t PruneRotatedLogs(const string& log_file, uint32_t retention_days,
                          time_t now) {
  fs::path log_path(log_file);
  fs::path directory = log_path.parent_path();
  if (directory.empty())
    directory = ".";
  string prefix = log_path.filename().string() + ".";
  time_t cutoff = now - static_cast<time_t>(retention_days * SECONDS_IN_DAY);
  uint32_t removed = 0;
  boost::system::error_code ec;
  fs::directory_iterator it(directory, ec);
  if (ec) {
    LOG(WARNING) << "Failed to list log directory " << directory.string()
                 << ": " << ec.message();
    return 0;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      LOG(WARNING) << "Failed to continue listing " << directory.string()
                   << ": " << ec.message();
      break;
    }
    const fs::path& candidate = it->path();
    if (!boost::algorithm::starts_with(candidate.filename().string(), prefix))
      continue;
    if (!fs::is_regular_file(candidate, ec))
      continue;
    time_t modified = fs::last_write_time(candidate, ec);
    if (ec) {
      LOG(WARNING) << "Failed to stat " << candidate.string() << ": "
                   << ec.message();
      continue;
    }
    if (modified >= cutoff)
      continue;
    if (!fs::remove(candidate, ec) || ec) {
      LOG(WARNING) << "Failed to remove old log " << candidate.string()
                   << ": " << ec.message();
      continue;
    }
    LOG(INFO) << "Removed log file older than " << retention_days
              << " days: " << candidate.string();
    ++removed;
  }
  return removed;
}

}  // namespace nvidler
