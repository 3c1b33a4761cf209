#include "common/Subprocess.hpp"

#include "common/Logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace rwd::common {

namespace {

constexpr int kSpawnFailedExit = 127;

void closeFd(int& iFd) {
  if (iFd >= 0) {
    ::close(iFd);
    iFd = -1;
  }
}

/// Drain whatever is readable on iFd into sOut. Closes the fd on EOF.
void drain(int& iFd, std::string& sOut) {
  std::array<char, 4096> vBuf{};
  const ssize_t nRead = ::read(iFd, vBuf.data(), vBuf.size());
  if (nRead > 0) {
    sOut.append(vBuf.data(), static_cast<size_t>(nRead));
  } else if (nRead == 0 || (errno != EINTR && errno != EAGAIN)) {
    closeFd(iFd);
  }
}

}  // namespace

std::string Subprocess::describe(const std::vector<std::string>& vArgv) {
  std::string sOut;
  for (const auto& sArg : vArgv) {
    if (!sOut.empty()) sOut += ' ';
    if (sArg.find(' ') != std::string::npos) {
      sOut += '\'' + sArg + '\'';
    } else {
      sOut += sArg;
    }
  }
  return sOut;
}

CommandResult Subprocess::run(const std::vector<std::string>& vArgv,
                              std::chrono::milliseconds durTimeout,
                              const std::string& sWorkDir) {
  CommandResult cr;
  auto spLog = Logger::get();

  if (vArgv.empty()) {
    cr.bSpawnFailed = true;
    cr.sStderr = "empty command";
    return cr;
  }

  spLog->debug("exec: {}", describe(vArgv));

  int vOutPipe[2] = {-1, -1};
  int vErrPipe[2] = {-1, -1};
  // Children forked by other threads must not inherit these ends
  if (::pipe2(vOutPipe, O_CLOEXEC) != 0 || ::pipe2(vErrPipe, O_CLOEXEC) != 0) {
    closeFd(vOutPipe[0]);
    closeFd(vOutPipe[1]);
    cr.bSpawnFailed = true;
    cr.sStderr = std::string("pipe failed: ") + std::strerror(errno);
    return cr;
  }

  // argv must be built before fork; the child may only call async-signal-safe functions
  std::vector<char*> vRawArgv;
  vRawArgv.reserve(vArgv.size() + 1);
  for (const auto& sArg : vArgv) {
    vRawArgv.push_back(const_cast<char*>(sArg.c_str()));
  }
  vRawArgv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    closeFd(vOutPipe[0]);
    closeFd(vOutPipe[1]);
    closeFd(vErrPipe[0]);
    closeFd(vErrPipe[1]);
    cr.bSpawnFailed = true;
    cr.sStderr = std::string("fork failed: ") + std::strerror(errno);
    return cr;
  }

  if (pid == 0) {
    ::dup2(vOutPipe[1], STDOUT_FILENO);
    ::dup2(vErrPipe[1], STDERR_FILENO);
    ::close(vOutPipe[0]);
    ::close(vOutPipe[1]);
    ::close(vErrPipe[0]);
    ::close(vErrPipe[1]);
    const int iNull = ::open("/dev/null", O_RDONLY);
    if (iNull >= 0) {
      ::dup2(iNull, STDIN_FILENO);
      ::close(iNull);
    }
    if (!sWorkDir.empty() && ::chdir(sWorkDir.c_str()) != 0) {
      _exit(kSpawnFailedExit);
    }
    ::execvp(vRawArgv[0], vRawArgv.data());
    _exit(kSpawnFailedExit);
  }

  closeFd(vOutPipe[1]);
  closeFd(vErrPipe[1]);
  int iOutFd = vOutPipe[0];
  int iErrFd = vErrPipe[0];

  const auto tpDeadline = std::chrono::steady_clock::now() + durTimeout;

  while (iOutFd >= 0 || iErrFd >= 0) {
    const auto durLeft = std::chrono::duration_cast<std::chrono::milliseconds>(
        tpDeadline - std::chrono::steady_clock::now());
    if (durLeft.count() <= 0) {
      cr.bTimedOut = true;
      break;
    }

    std::array<pollfd, 2> vFds{};
    nfds_t nFds = 0;
    if (iOutFd >= 0) vFds[nFds++] = pollfd{iOutFd, POLLIN, 0};
    if (iErrFd >= 0) vFds[nFds++] = pollfd{iErrFd, POLLIN, 0};

    const int iReady = ::poll(vFds.data(), nFds, static_cast<int>(durLeft.count()));
    if (iReady < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (nfds_t i = 0; i < nFds; ++i) {
      if (vFds[i].revents == 0) continue;
      if (vFds[i].fd == iOutFd) {
        drain(iOutFd, cr.sStdout);
      } else if (vFds[i].fd == iErrFd) {
        drain(iErrFd, cr.sStderr);
      }
    }
  }

  closeFd(iOutFd);
  closeFd(iErrFd);

  int iStatus = 0;

  // Output closed but the child may still be running; keep honouring the deadline
  while (!cr.bTimedOut) {
    const pid_t pidDone = ::waitpid(pid, &iStatus, WNOHANG);
    if (pidDone == pid) break;
    if (pidDone < 0 && errno != EINTR) break;
    if (std::chrono::steady_clock::now() >= tpDeadline) {
      cr.bTimedOut = true;
      break;
    }
    ::usleep(10 * 1000);
  }

  if (cr.bTimedOut) {
    ::kill(pid, SIGKILL);
  }

  while (::waitpid(pid, &iStatus, 0) < 0) {
    if (errno == ECHILD) break;
    if (errno != EINTR) {
      cr.bSpawnFailed = true;
      return cr;
    }
  }

  if (WIFEXITED(iStatus)) {
    cr.iExitCode = WEXITSTATUS(iStatus);
    if (cr.iExitCode == kSpawnFailedExit && cr.sStdout.empty() && cr.sStderr.empty()) {
      cr.bSpawnFailed = true;
      cr.sStderr = "failed to execute " + vArgv.front();
    }
  } else {
    cr.iExitCode = -1;
  }

  if (cr.bTimedOut) {
    spLog->warn("Command timed out after {}ms: {}", durTimeout.count(), describe(vArgv));
  }
  return cr;
}

}  // namespace rwd::common
