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
 ** The handlers only record which signal arrived. Long blocking waits
 ** (the stage runner's poll loop) check pending_interrupt() and unwind
 ** by throwing InterruptedException, so scoped resources such as the
 ** working directory are released before the process goes down.
 **
 **/

#pragma once

#include <string>

namespace assertp4 {

/** Install recording handlers for SIGINT, SIGTERM and SIGHUP.
 *  The handlers are installed without SA_RESTART so that blocking
 *  system calls return EINTR.
 */
void install_interrupt_handlers();

/** @return the pending signal number, or 0 if none arrived */
int pending_interrupt();

/** Forget a pending signal. */
void clear_interrupt();

/** Restore the default disposition of sig and raise it again.
 *  Used by main after the report has been written.
 */
void reraise_interrupt(int sig);

std::string signal_name(int sig);

}  // namespace assertp4
