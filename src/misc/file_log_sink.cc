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

#include "misc/file_log_sink.h"

#include <string>

namespace nvidler {

FileLogSink::FileLogSink(const string& path)
  : path_(path), file_(NULL) {
}

FileLogSink::~FileLogSink() {
  Close();
}

// N.B.: errors are logged only after file_mutex_ is released, as the log
// message may come straight back into send().
bool FileLogSink::Open() {
  {
    boost::lock_guard<boost::mutex> lock(file_mutex_);
    if (file_)
      return true;
    file_ = fopen(path_.c_str(), "a");
    if (file_)
      return true;
  }
  PLOG(ERROR) << "Failed to open log file " << path_;
  return false;
}

void FileLogSink::Close() {
  int ret = 0;
  {
    boost::lock_guard<boost::mutex> lock(file_mutex_);
    if (!file_)
      return;
    ret = fclose(file_);
    file_ = NULL;
  }
  if (ret != 0)
    PLOG(ERROR) << "Failed to close log file " << path_;
}

void FileLogSink::send(google::LogSeverity severity, const char* full_filename,
                       const char* base_filename, int line,
                       const struct ::tm* tm_time, const char* message,
                       size_t message_len) {
  string formatted = ToString(severity, base_filename, line, tm_time, message,
                              message_len);
  boost::lock_guard<boost::mutex> lock(file_mutex_);
  if (!file_)
    return;
  fprintf(file_, "%s\n", formatted.c_str());
  fflush(file_);
}

}  // namespace nvidler
