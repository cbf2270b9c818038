/*********************                                                        */
/*! \file
 ** \verbatim
 ** This file is part of the assertp4 project.
 ** Copyright (c) 2026 by the authors listed in the file AUTHORS
 ** in the top-level source directory) and their institutional affiliations.
 ** All rights reserved.  See the file LICENSE in the top-level source
 ** directory for licensing information.\endverbatim
 **
 ** \brief
 **
 **
 **/

#pragma once

#include <exception>
#include <string>

namespace assertp4 {

/** Base of every exception thrown by assertp4. */
class AssertP4Exception : public std::exception
{
 public:
  explicit AssertP4Exception(const char * message) : msg(message) {}

  explicit AssertP4Exception(const std::string & message) : msg(message) {}

  virtual ~AssertP4Exception() throw() {}

  /** @return the message; owned by the exception */
  virtual const char * what() const throw() { return msg.c_str(); }

 protected:
  std::string msg;
};

/** A termination signal arrived while a stage was running.
 *  The child process group has already been killed when this is thrown.
 */
class InterruptedException : public AssertP4Exception
{
 public:
  InterruptedException(int sig, const std::string & message)
      : AssertP4Exception(message), sig_(sig)
  {
  }

  int signal_number() const { return sig_; }

 protected:
  int sig_;
};

}  // namespace assertp4
