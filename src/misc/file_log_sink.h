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

// glog sink that appends every log line to the monitor's log file, while
// glog itself mirrors the same lines to the console.

#ifndef NVIDLER_MISC_FILE_LOG_SINK_H
#define NVIDLER_MISC_FILE_LOG_SINK_H

#include <stdio.h>

#include <string>

#include <boost/noncopyable.hpp>
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>

#include "base/common.h"

namespace nvidler {

class FileLogSink : public google::LogSink, private boost::noncopyable {
 public:
  explicit FileLogSink(const string& path);
  virtual ~FileLogSink();
  // Opens the file for appending, creating it if necessary.
  bool Open();
  void Close();
  bool is_open() const { return file_ != NULL; }
  virtual void send(google::LogSeverity severity, const char* full_filename,
                    const char* base_filename, int line,
                    const struct ::tm* tm_time, const char* message,
                    size_t message_len);

 private:
  const string path_;
  FILE* file_;
  boost::mutex file_mutex_;
};

}  // namespace nvidler

#endif  // NVIDLER_MISC_FILE_LOG_SINK_H
