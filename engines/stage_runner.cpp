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

#include "engines/stage_runner.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "utils/exceptions.h"
#include "utils/logger.h"
#include "utils/signals.h"
#include "utils/str_util.h"
#include "utils/timestamp.h"

using namespace std::chrono;

namespace assertp4 {

namespace {

// upper bound on a single poll() so pending signals are noticed promptly
const int POLL_INTERVAL_MS = 100;

const milliseconds DEFAULT_KILL_GRACE(1000);

// what the child reports through the exec pipe before _exit
enum ChildFailure
{
  CHILD_CHDIR_FAILED = 1,
  CHILD_EXEC_FAILED
};

struct ChildReport
{
  int step;
  int err;
};

// owns one file descriptor
struct Fd
{
  Fd() : fd(-1) {}
  ~Fd() { reset(); }

  Fd(const Fd &) = delete;
  Fd & operator=(const Fd &) = delete;

  void reset(int f = -1)
  {
    if (fd >= 0) {
      ::close(fd);
    }
    fd = f;
  }

  int fd;
};

std::string errno_string(int err) { return std::strerror(err); }

void make_pipe(Fd & read_end, Fd & write_end)
{
  int p[2];
  if (::pipe2(p, O_CLOEXEC) != 0) {
    throw AssertP4Exception("pipe failed: " + errno_string(errno));
  }
  read_end.reset(p[0]);
  write_end.reset(p[1]);
}

int decode_status(int status)
{
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return 1;
}

void kill_group(pid_t pid)
{
  // negative pid addresses the whole process group the child leads
  if (::kill(-pid, SIGKILL) != 0) {
    ::kill(pid, SIGKILL);
  }
}

// blocking reap; only called once the child is dead or dying
void reap(pid_t pid, int & status)
{
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      status = 0;
      return;
    }
  }
}

enum DrainResult
{
  DRAIN_EOF,
  DRAIN_DEADLINE,
  DRAIN_INTERRUPTED,
  DRAIN_ERROR
};

/* Read from both pipes, whichever has data, until both reach EOF.
 * Neither pipe is ever read to completion before the other one: a child
 * blocked writing to a full stderr pipe is serviced even while stdout
 * is still open.
 */
DrainResult drain(Fd (&pipes)[2],
                  std::string (&sinks)[2],
                  assertp4_time_stamp deadline,
                  bool watch_interrupts,
                  int & poll_errno)
{
  char buf[65536];
  while (pipes[0].fd >= 0 || pipes[1].fd >= 0) {
    if (watch_interrupts && pending_interrupt()) {
      return DRAIN_INTERRUPTED;
    }
    const long long remaining =
        duration_cast<milliseconds>(deadline - timestamp()).count();
    if (remaining <= 0) {
      return DRAIN_DEADLINE;
    }

    struct pollfd fds[2];
    for (int i = 0; i < 2; ++i) {
      fds[i].fd = pipes[i].fd;  // negative entries are ignored by poll
      fds[i].events = POLLIN;
      fds[i].revents = 0;
    }
    const int wait_ms =
        static_cast<int>(std::min<long long>(remaining, POLL_INTERVAL_MS));
    const int n = ::poll(fds, 2, wait_ms);
    if (n < 0) {
      if (errno == EINTR) continue;
      poll_errno = errno;
      return DRAIN_ERROR;
    }

    for (int i = 0; i < 2; ++i) {
      if (pipes[i].fd < 0 || fds[i].revents == 0) continue;
      const ssize_t r = ::read(pipes[i].fd, buf, sizeof(buf));
      if (r > 0) {
        sinks[i].append(buf, static_cast<size_t>(r));
      } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
        pipes[i].reset();
      }
    }
  }
  return DRAIN_EOF;
}

// poll for exit of pid until the deadline or a termination signal
bool wait_until(pid_t pid, assertp4_time_stamp deadline, int & status)
{
  for (;;) {
    const pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      return true;
    }
    if (r < 0 && errno != EINTR) {
      // not our child any more; nothing left to wait for
      status = 0;
      return true;
    }
    if (pending_interrupt() || timestamp() >= deadline) {
      return false;
    }
    ::poll(nullptr, 0, 10);
  }
}

}  // namespace

ProcessStageRunner::ProcessStageRunner() : kill_grace_(DEFAULT_KILL_GRACE) {}

ProcessStageRunner::ProcessStageRunner(milliseconds kill_grace)
    : kill_grace_(kill_grace)
{
}

StageResult ProcessStageRunner::run(const StageSpec & spec)
{
  const std::string stage_name = to_string(spec.stage);
  if (spec.argv.empty()) {
    throw AssertP4Exception("No command given for stage " + stage_name);
  }
  if (int sig = pending_interrupt()) {
    throw InterruptedException(
        sig, "Interrupted by " + signal_name(sig) + " before " + stage_name);
  }

  logger.log(1, "Running {}: {}", stage_name, CommandLine(spec.argv));
  if (!spec.cwd.empty()) {
    logger.log(2, "  in {}", spec.cwd);
  }

  std::vector<char *> cargs;
  cargs.reserve(spec.argv.size() + 1);
  for (const auto & a : spec.argv) cargs.push_back(const_cast<char *>(a.c_str()));
  cargs.push_back(nullptr);
  const char * cwd = spec.cwd.empty() ? nullptr : spec.cwd.c_str();

  Fd devnull;
  devnull.reset(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (devnull.fd < 0) {
    throw AssertP4Exception("Cannot open /dev/null: " + errno_string(errno));
  }
  Fd pipes[2];  // stdout, stderr
  Fd out_w, err_w, report_r, report_w;
  make_pipe(pipes[0], out_w);
  make_pipe(pipes[1], err_w);
  make_pipe(report_r, report_w);

  const assertp4_time_stamp start = timestamp();
  const pid_t pid = ::fork();
  if (pid < 0) {
    throw AssertP4Exception("fork failed: " + errno_string(errno));
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only
    ::setpgid(0, 0);
    ::dup2(devnull.fd, STDIN_FILENO);
    ::dup2(out_w.fd, STDOUT_FILENO);
    ::dup2(err_w.fd, STDERR_FILENO);

    ChildReport report;
    if (cwd != nullptr && ::chdir(cwd) != 0) {
      report.step = CHILD_CHDIR_FAILED;
    } else {
      ::execvp(cargs[0], cargs.data());
      report.step = CHILD_EXEC_FAILED;
    }
    // exec failed, let parent know
    report.err = errno;
    ssize_t ignored = ::write(report_w.fd, &report, sizeof(report));
    (void)ignored;
    ::_exit(127);
  }

  // Parent continues: set the group here too, whichever side runs first
  ::setpgid(pid, pid);
  out_w.reset();
  err_w.reset();
  report_w.reset();
  devnull.reset();

  // Did the child reach exec? The report pipe is close-on-exec, so a
  // successful exec reads as EOF.
  ChildReport report;
  ssize_t n;
  do {
    n = ::read(report_r.fd, &report, sizeof(report));
  } while (n < 0 && errno == EINTR);
  report_r.reset();
  if (n == static_cast<ssize_t>(sizeof(report))) {
    int status = 0;
    reap(pid, status);
    if (report.step == CHILD_CHDIR_FAILED) {
      throw AssertP4Exception("Cannot enter directory '" + spec.cwd
                              + "': " + errno_string(report.err));
    }
    throw AssertP4Exception("Failed to execute '" + spec.argv[0]
                            + "': " + errno_string(report.err));
  }

  std::string sinks[2];
  const assertp4_time_stamp deadline = start + spec.timeout;
  int poll_errno = 0;
  const DrainResult drained =
      drain(pipes, sinks, deadline, true, poll_errno);

  int status = 0;
  bool exited = false;
  if (drained == DRAIN_EOF) {
    exited = wait_until(pid, deadline, status);
  }

  StageResult result;
  if (exited) {
    result.exit_code = decode_status(status);
    result.status = (result.exit_code == 0) ? STAGE_OK : STAGE_FAILED;
  } else {
    kill_group(pid);
    // collect what the group wrote before it died
    int ignored_errno = 0;
    drain(pipes, sinks, timestamp() + kill_grace_, false, ignored_errno);
    reap(pid, status);

    if (drained == DRAIN_ERROR) {
      throw AssertP4Exception("poll failed while running " + stage_name + ": "
                              + errno_string(poll_errno));
    }
    if (int sig = pending_interrupt()) {
      throw InterruptedException(sig,
                                 "Interrupted by " + signal_name(sig)
                                     + " while running " + stage_name);
    }
    result.status = STAGE_TIMED_OUT;
    result.exit_code = -1;
  }

  result.out = std::move(sinks[0]);
  result.err = std::move(sinks[1]);
  result.duration = duration_cast<milliseconds>(timestamp() - start);

  logger.log(1,
             "{} {} after {} ms (exit code {})",
             stage_name,
             to_string(result.status),
             result.duration.count(),
             result.exit_code);
  logger.log(3, "{} output:\n{}", stage_name, result.combined());
  return result;
}

}  // namespace assertp4
