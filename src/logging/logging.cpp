// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <signal.h> // For sigaction(), sigemptyset().

#include <iostream>
#include <string>

#include <glog/logging.h>
#include <glog/raw_logging.h>

#include <process/once.hpp>

#include <stout/exit.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include <stout/os/mkdir.hpp>
#include <stout/os/signals.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::string;

namespace ocibridge {
namespace internal {
namespace logging {

// `InitGoogleLogging` keeps the pointer it is given, so the program
// name has to outlive the call.
static string argv0;


// Only RAW_LOG is safe here: it neither allocates nor takes locks.
static void handler(int signal, siginfo_t* siginfo, void* context)
{
  if (signal != SIGTERM) {
    RAW_LOG(FATAL, "Unexpected signal in signal handler: %d", signal);
  }

  // A signal sent by `kill` carries the sender.
  if (siginfo->si_code == SI_USER ||
      siginfo->si_code == SI_QUEUE ||
      siginfo->si_code <= 0) {
    RAW_LOG(WARNING, "Stopping the copy on SIGTERM from process %d of user %d",
            siginfo->si_pid, siginfo->si_uid);
  } else {
    RAW_LOG(WARNING, "Stopping the copy on SIGTERM");
  }

  // Re-raise with the default disposition so that no stack trace is
  // printed.
  os::signals::reset(signal);
  raise(signal);
}


static google::LogSeverity parseSeverity(const string& level)
{
  if (level == "ERROR") {
    return google::ERROR;
  }

  if (level == "WARNING") {
    return google::WARNING;
  }

  // The flag validator only lets 'INFO' through otherwise.
  return google::INFO;
}


void initialize(
    const string& _argv0,
    bool installFailureSignalHandler,
    const Option<Flags>& _flags)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  argv0 = _argv0;

  // Use the default flags if not specified.
  Flags flags;
  if (_flags.isSome()) {
    flags = _flags.get();

    FLAGS_minloglevel = parseSeverity(flags.logging_level);
    FLAGS_logbufsecs = flags.logbufsecs;
  }

  if (flags.log_dir.isSome()) {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      EXIT(EXIT_FAILURE)
        << "Could not initialize logging: Failed to create directory "
        << flags.log_dir.get() << ": " << mkdir.error();
    }

    FLAGS_log_dir = flags.log_dir.get();
    FLAGS_logtostderr = false;
  } else {
    // Log to stderr instead of log files.
    FLAGS_logtostderr = true;
  }

  // Log everything to stderr IN ADDITION to log files unless
  // otherwise specified.
  if (flags.quiet) {
    FLAGS_stderrthreshold = 3; // FATAL.

    // FLAGS_stderrthreshold is ignored when logging to stderr instead
    // of log files. Setting the minimum log level gets around this issue.
    if (FLAGS_logtostderr) {
      FLAGS_minloglevel = 3; // FATAL.
    }
  } else {
    FLAGS_stderrthreshold = FLAGS_minloglevel;
  }

  google::InitGoogleLogging(argv0.c_str());

  VLOG(1) << "Logging to " <<
    (flags.log_dir.isSome() ? flags.log_dir.get() : "STDERR");

  if (installFailureSignalHandler) {
    // Handles SIGSEGV, SIGILL, SIGFPE, SIGABRT, SIGBUS, SIGTERM
    // by default.
    google::InstallFailureSignalHandler();

    // We do not want SIGTERM to dump a stacktrace, as this can imply
    // that we crashed, when we were in fact terminated by user request.
    struct sigaction action;
    action.sa_sigaction = handler;

    // Do not block additional signals while in the handler.
    sigemptyset(&action.sa_mask);

    // The SA_SIGINFO flag tells sigaction() to use
    // the sa_sigaction field, not sa_handler.
    action.sa_flags = SA_SIGINFO;

    if (sigaction(SIGTERM, &action, nullptr) < 0) {
      PLOG(FATAL) << "Failed to set sigaction";
    }
  }

  initialized->done();
}

} // namespace logging {
} // namespace internal {
} // namespace ocibridge {
