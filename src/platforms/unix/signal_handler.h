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

// Signal handling on UNIX/POSIX platforms.
//
// The handler blocks the given signals in the calling thread (and hence in
// every thread created after it) and waits for them synchronously on a
// dedicated thread, so that the callback may do anything a normal thread can,
// such as taking locks and logging.

#ifndef NVIDLER_PLATFORMS_UNIX_SIGNAL_HANDLER_H
#define NVIDLER_PLATFORMS_UNIX_SIGNAL_HANDLER_H

#include <csignal>

#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/thread.hpp>

#include "base/common.h"

namespace nvidler {
namespace platform_unix {

class SignalHandler : private boost::noncopyable {
 public:
  typedef boost::function<void(int)> SignalCallback;  // NOLINT

  SignalHandler();
  ~SignalHandler();
  // Must be called before any other thread is started.
  void ConfigureSignal(int signum);
  // Starts the waiting thread; the callback runs once, for the first of the
  // configured signals to arrive.
  void Start(SignalCallback callback);

 private:
  void WaitForSignal(sigset_t signals, SignalCallback callback);

  sigset_t signals_;
  boost::scoped_ptr<boost::thread> waiter_thread_;
};

}  // namespace platform_unix
}  // namespace nvidler

#endif  // NVIDLER_PLATFORMS_UNIX_SIGNAL_HANDLER_H
