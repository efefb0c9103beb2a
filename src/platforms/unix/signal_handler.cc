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

// UNIX/POSIX signal handler implementation.

#include "platforms/unix/signal_handler.h"

#include <errno.h>
#include <pthread.h>
#include <string.h>

#include <boost/bind.hpp>

namespace nvidler {
namespace platform_unix {

SignalHandler::SignalHandler() {
  sigemptyset(&signals_);
  VLOG(1) << "Signal handler set up, ready to add signals.";
}

SignalHandler::~SignalHandler() {
  if (waiter_thread_) {
    // The waiter is blocked in sigwait() unless a signal arrived. It only
    // uses its own copies of the signal set and callback, so it is left to
    // end with the process.
    waiter_thread_->detach();
  }
}

void SignalHandler::ConfigureSignal(int signum) {
  sigaddset(&signals_, signum);
  int ret = pthread_sigmask(SIG_BLOCK, &signals_, NULL);
  if (ret != 0)
    LOG(ERROR) << "Failed to block signal " << signum << ": " << strerror(ret);
}

void SignalHandler::Start(SignalCallback callback) {
  CHECK(!waiter_thread_) << "Signal handler started twice";
  waiter_thread_.reset(new boost::thread(
      boost::bind(&SignalHandler::WaitForSignal, this, signals_, callback)));
}

void SignalHandler::WaitForSignal(sigset_t signals,
                                  SignalCallback callback) {
  int signum = 0;
  int ret;
  do {
    ret = sigwait(&signals, &signum);
  } while (ret == EINTR);
  if (ret != 0) {
    LOG(ERROR) << "sigwait failed: " << strerror(ret);
    return;
  }
  LOG(INFO) << "Received signal " << signum << " (" << strsignal(signum)
            << ")";
  callback(signum);
}

}  // namespace platform_unix
}  // namespace nvidler
