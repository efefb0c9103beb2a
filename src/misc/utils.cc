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

#include "misc/utils.h"

extern "C" {
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
}
#include <string>
#include <vector>

#ifdef __linux__
#include <sys/prctl.h>
#endif

#include <boost/algorithm/string/trim.hpp>

#include "base/units.h"

namespace nvidler {

namespace {

uint64_t MonotonicMillis() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * SECONDS_TO_MILLISECONDS +
    static_cast<uint64_t>(ts.tv_nsec) / 1000000ULL;
}

// Reaps the child, killing it first if it is still around at the deadline.
// Returns the wait status, or -1 if the child had to be killed.
int32_t WaitForFinishOrKill(pid_t pid, uint64_t deadline_ms) {
  int status;
  while (true) {
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid)
      break;
    if (ret < 0 && errno != EINTR) {
      PLOG(ERROR) << "waitpid failed for subprocess " << pid;
      return -1;
    }
    if (MonotonicMillis() >= deadline_ms) {
      LOG(WARNING) << "Subprocess with PID " << pid << " did not exit in "
                   << "time; killing it.";
      kill(pid, SIGKILL);
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      return -1;
    }
    usleep(5000);
  }
  if (WIFEXITED(status)) {
    VLOG(2) << "Subprocess with PID " << pid << " exited with status "
            << WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    VLOG(1) << "Subprocess with PID " << pid << " exited due to uncaught "
            << "signal " << WTERMSIG(status);
  } else {
    LOG(ERROR) << "Unexpected exit status: " << hex << status << dec;
  }
  return status;
}

}  // namespace

bool RunCommandWithTimeout(const string& binary, const vector<string>& args,
                           uint64_t timeout_ms, string* output) {
  CHECK_NOTNULL(output);
  output->clear();
  // Convert args from string to char*
  vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(binary.c_str()));
  for (uint32_t i = 0; i < args.size(); ++i) {
    // N.B.: args outlives the execvp call, so the pointers stay valid.
    argv.push_back(const_cast<char*>(args[i].c_str()));
  }
  // The last argument to execvp is always NULL.
  argv.push_back(NULL);
  string full_cmd_line = binary;
  for (uint32_t i = 0; i < args.size(); ++i)
    full_cmd_line += " " + args[i];
  VLOG(2) << "Executing externally: " << full_cmd_line;

  int outfd[2];
  if (pipe(outfd) != 0) {
    PLOG(ERROR) << "Failed to create pipe for '" << full_cmd_line << "'";
    return false;
  }
  uint64_t deadline_ms = MonotonicMillis() + timeout_ms;
  pid_t pid = fork();
  switch (pid) {
    case -1:
      // Error
      PLOG(ERROR) << "Failed to fork child process for '" << full_cmd_line
                  << "'";
      close(outfd[0]);
      close(outfd[1]);
      return false;
    case 0: {
      // Child. Only async-signal-safe calls from here until exec.
      if (dup2(outfd[1], STDOUT_FILENO) != STDOUT_FILENO)
        _exit(127);
      int devnull = open("/dev/null", O_RDWR);
      if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        dup2(devnull, STDERR_FILENO);
      }
      // Close all file descriptors other than stdin, stdout and stderr, so
      // that the tool does not inherit the log file or sockets.
      int fds;
      if ((fds = getdtablesize()) == -1) fds = OPEN_MAX_GUESS;
      for (int fd = 3; fd < fds; fd++)
        close(fd);
      // The monitor blocks its shutdown signals in every thread; do not pass
      // that mask on to the tool.
      sigset_t empty_mask;
      sigemptyset(&empty_mask);
      sigprocmask(SIG_SETMASK, &empty_mask, NULL);
      // kill child process if the monitor terminates
#ifdef __linux__
      prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
      execvp(argv[0], &argv[0]);
      // execvp only returns if there was an error
      _exit(127);
    }
    default:
      break;
  }
  // Parent
  VLOG(2) << "Subprocess with PID " << pid << " created.";
  CHECK_EQ(close(outfd[1]), 0);
  bool timed_out = false;
  char buffer[4096];
  while (true) {
    uint64_t now_ms = MonotonicMillis();
    if (now_ms >= deadline_ms) {
      timed_out = true;
      break;
    }
    struct pollfd pfd;
    pfd.fd = outfd[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = poll(&pfd, 1, static_cast<int>(deadline_ms - now_ms));
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      PLOG(ERROR) << "poll failed on output of '" << full_cmd_line << "'";
      break;
    }
    if (ready == 0) {
      timed_out = true;
      break;
    }
    ssize_t n = read(outfd[0], buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      PLOG(ERROR) << "Failed to read output of '" << full_cmd_line << "'";
      break;
    }
    if (n == 0)
      break;  // EOF
    output->append(buffer, static_cast<size_t>(n));
  }
  CHECK_EQ(close(outfd[0]), 0);
  if (timed_out) {
    LOG(WARNING) << "'" << full_cmd_line << "' timed out after "
                 << timeout_ms << " ms; killing PID " << pid;
    kill(pid, SIGKILL);
    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return false;
  }
  int32_t status = WaitForFinishOrKill(pid, deadline_ms);
  if (status == -1)
    return false;
  if (!WIFEXITED(status)) {
    LOG(WARNING) << "'" << full_cmd_line << "' terminated abnormally";
    return false;
  }
  if (WEXITSTATUS(status) == 127) {
    LOG(WARNING) << "'" << full_cmd_line << "' could not be executed";
    return false;
  }
  return WEXITSTATUS(status) == 0;
}

bool ParseLstartTimestamp(const string& text, time_t* timestamp) {
  string trimmed = boost::algorithm::trim_copy(text);
  if (trimmed.empty())
    return false;
  struct tm dt;
  memset(&dt, 0, sizeof(dt));
  const char* end = strptime(trimmed.c_str(), "%a %b %d %H:%M:%S %Y", &dt);
  if (end == NULL || *end != '\0')
    return false;
  // Let mktime work out whether DST applied at that time.
  dt.tm_isdst = -1;
  time_t result = mktime(&dt);
  if (result == static_cast<time_t>(-1))
    return false;
  *timestamp = result;
  return true;
}

string TimestampToLstartString(const time_t rawtime) {
  struct tm dt;
  char buffer[64];
  localtime_r(&rawtime, &dt);
  strftime(buffer, sizeof(buffer), "%a %b %e %H:%M:%S %Y", &dt);
  return string(buffer);
}

}  // namespace nvidler
