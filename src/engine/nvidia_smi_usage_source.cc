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

#include "engine/nvidia_smi_usage_source.h"

#include <sys/types.h>

#include <limits>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "base/units.h"
#include "misc/utils.h"

namespace nvidler {

NvidiaSmiUsageSource::NvidiaSmiUsageSource(const string& nvidia_smi_binary,
                                           uint64_t timeout_ms)
  : nvidia_smi_binary_(nvidia_smi_binary),
    timeout_ms_(timeout_ms) {
}

bool NvidiaSmiUsageSource::ListAcceleratorProcesses(
    vector<AcceleratorProcessRecord>* records) {
  CHECK_NOTNULL(records);
  records->clear();
  vector<string> args;
  args.push_back("--query-compute-apps=pid,used_memory");
  args.push_back("--format=csv,noheader,nounits");
  string output;
  if (!RunCommandWithTimeout(nvidia_smi_binary_, args, timeout_ms_,
                             &output)) {
    LOG(WARNING) << "Failed to query GPU processes via "
                 << nvidia_smi_binary_;
    return false;
  }
  VLOG(1) << "Raw compute app list:\n" << output;
  uint32_t skipped = ParseComputeAppsCsv(output, records);
  VLOG(1) << "Parsed " << records->size() << " GPU processes, skipped "
          << skipped << " malformed lines.";
  return true;
}

uint32_t NvidiaSmiUsageSource::ParseComputeAppsCsv(
    const string& output, vector<AcceleratorProcessRecord>* records) {
  uint32_t skipped = 0;
  vector<string> lines;
  boost::split(lines, output, boost::is_any_of("\n"));
  for (vector<string>::iterator line = lines.begin();
       line != lines.end();
       ++line) {
    boost::trim(*line);
    if (line->empty())
      continue;
    vector<string> fields;
    boost::split(fields, *line, boost::is_any_of(","));
    if (fields.size() != 2) {
      LOG(INFO) << "Ignoring malformed GPU process line '" << *line << "'";
      ++skipped;
      continue;
    }
    boost::trim(fields[0]);
    boost::trim(fields[1]);
    uint64_t pid;
    uint64_t used_memory_mib;
    // lexical_cast wraps negative numbers around for unsigned targets.
    if (fields[0].empty() || fields[1].empty() ||
        fields[0][0] == '-' || fields[1][0] == '-') {
      LOG(INFO) << "Ignoring GPU process line with invalid fields '" << *line
                << "'";
      ++skipped;
      continue;
    }
    try {
      pid = boost::lexical_cast<uint64_t>(fields[0]);
      used_memory_mib = boost::lexical_cast<uint64_t>(fields[1]);
    } catch (const boost::bad_lexical_cast& e) {
      LOG(INFO) << "Ignoring GPU process line with unparseable fields '"
                << *line << "'";
      ++skipped;
      continue;
    }
    if (pid == 0 ||
        pid > static_cast<uint64_t>(numeric_limits<pid_t>::max())) {
      LOG(INFO) << "Ignoring GPU process line with invalid PID '" << *line
                << "'";
      ++skipped;
      continue;
    }
    // A non-zero figure must never wrap around to zero bytes.
    if (used_memory_mib > numeric_limits<uint64_t>::max() / MB_TO_BYTES) {
      LOG(INFO) << "Ignoring GPU process line with out-of-range memory use '"
                << *line << "'";
      ++skipped;
      continue;
    }
    AcceleratorProcessRecord record;
    record.set_pid(pid);
    record.set_used_memory_bytes(used_memory_mib * MB_TO_BYTES);
    records->push_back(record);
  }
  return skipped;
}

}  // namespace nvidler
