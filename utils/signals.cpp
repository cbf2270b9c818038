/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief Termination signal bookkeeping.
 **
 **
 **/

#include "utils/signals.h"

#include <signal.h>

#include <csignal>
#include <cstring>

#include "utils/exceptions.h"

namespace assertp4 {

namespace {

volatile std::sig_atomic_t interrupt_signal = 0;

void record_interrupt(int sig) { interrupt_signal = sig; }

}  // namespace

void install_interrupt_handlers()
{
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = record_interrupt;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  for (int sig : { SIGINT, SIGTERM, SIGHUP }) {
    if (sigaction(sig, &sa, nullptr) != 0) {
      throw AssertP4Exception("Failed to install handler for "
                              + signal_name(sig));
    }
  }
}

int pending_interrupt() { return interrupt_signal; }

void clear_interrupt() { interrupt_signal = 0; }

void reraise_interrupt(int sig)
{
  // Switch back to default handling for signal 'sig' and raise it.
  signal(sig, SIG_DFL);
  raise(sig);
}

std::string signal_name(int sig)
{
  switch (sig) {
    case SIGINT: return "SIGINT";
    case SIGTERM: return "SIGTERM";
    case SIGHUP: return "SIGHUP";
    case SIGKILL: return "SIGKILL";
    case SIGALRM: return "SIGALRM";
    default: return "signal " + std::to_string(sig);
  }
}

}  // namespace assertp4
