#include "depotsync/Process.hpp"
#include "depotsync/Errors.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char **environ;

namespace depotsync {

namespace {

class Pipe {
public:
  // Workers spawn concurrently: a descriptor leaked into a sibling child
  // would keep its stdin open.
  Pipe() {
#ifdef __linux__
    if (::pipe2(m_fds, O_CLOEXEC) != 0)
      throw Error(std::string("pipe: ") + std::strerror(errno));
#else
    if (::pipe(m_fds) != 0)
      throw Error(std::string("pipe: ") + std::strerror(errno));
    ::fcntl(m_fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(m_fds[1], F_SETFD, FD_CLOEXEC);
#endif
  }
  ~Pipe() {
    closeRead();
    closeWrite();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  int read() const { return m_fds[0]; }
  int write() const { return m_fds[1]; }
  void closeRead() { closeFd(m_fds[0]); }
  void closeWrite() { closeFd(m_fds[1]); }

private:
  int m_fds[2] = {-1, -1};

  static void closeFd(int &fd) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
};

void ignoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

// Runs in the forked child; only async-signal-safe calls from here on.
[[noreturn]] void execChild(char *const argv[], const char *workingDir,
                            Pipe &in, Pipe &out, Pipe &err, Pipe &report) {
  ::dup2(in.read(), STDIN_FILENO);
  ::dup2(out.write(), STDOUT_FILENO);
  ::dup2(err.write(), STDERR_FILENO);
  if (workingDir && ::chdir(workingDir) != 0) {
    int code = errno;
    ssize_t ignored = ::write(report.write(), &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
  }
  ::execvp(argv[0], argv);
  int code = errno;
  ssize_t ignored = ::write(report.write(), &code, sizeof(code));
  (void)ignored;
  ::_exit(127);
}

} // namespace

ProcessResult Process::run(const std::vector<std::string> &argv,
                           const std::string &input,
                           const std::string &workingDir) {
  if (argv.empty())
    throw Error("Empty command line");
  ignoreSigpipe();

  std::vector<char *> args;
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  // The child inherits the environment; PWD must name its working
  // directory for tools that trust it over getcwd().
  std::vector<std::string> envStrings;
  std::vector<char *> env;
  if (!workingDir.empty()) {
    for (char **e = environ; *e; ++e) {
      if (std::strncmp(*e, "PWD=", 4) != 0)
        envStrings.emplace_back(*e);
    }
    envStrings.push_back("PWD=" + workingDir);
    for (auto &e : envStrings)
      env.push_back(const_cast<char *>(e.c_str()));
    env.push_back(nullptr);
  }

  Pipe in, out, err, report;
  pid_t pid = ::fork();
  if (pid < 0)
    throw Error("fork failed for " + argv[0] + ": " + std::strerror(errno));
  if (pid == 0) {
    if (!workingDir.empty())
      environ = env.data();
    execChild(args.data(), workingDir.empty() ? nullptr : workingDir.c_str(),
              in, out, err, report);
  }

  in.closeRead();
  out.closeWrite();
  err.closeWrite();
  report.closeWrite();

  int launchError = 0;
  ssize_t n = ::read(report.read(), &launchError, sizeof(launchError));
  if (n == static_cast<ssize_t>(sizeof(launchError))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    throw Error("Could not run " + argv[0] + ": " +
                std::strerror(launchError));
  }

  ::fcntl(in.write(), F_SETFL, ::fcntl(in.write(), F_GETFL) | O_NONBLOCK);

  ProcessResult result;
  std::size_t written = 0;
  if (input.empty())
    in.closeWrite();

  char buffer[8192];
  bool outOpen = true, errOpen = true;
  while (outOpen || errOpen) {
    pollfd fds[3];
    nfds_t count = 0;
    int inIndex = -1, outIndex = -1, errIndex = -1;
    if (in.write() >= 0) {
      fds[count] = {in.write(), POLLOUT, 0};
      inIndex = static_cast<int>(count++);
    }
    if (outOpen) {
      fds[count] = {out.read(), POLLIN, 0};
      outIndex = static_cast<int>(count++);
    }
    if (errOpen) {
      fds[count] = {err.read(), POLLIN, 0};
      errIndex = static_cast<int>(count++);
    }

    if (::poll(fds, count, -1) < 0) {
      if (errno == EINTR)
        continue;
      break;
    }

    if (inIndex >= 0 && fds[inIndex].revents) {
      ssize_t w = ::write(in.write(), input.data() + written,
                          input.size() - written);
      if (w > 0)
        written += static_cast<std::size_t>(w);
      if (w < 0 && errno != EAGAIN && errno != EINTR)
        in.closeWrite(); // child closed its stdin early
      else if (written >= input.size())
        in.closeWrite();
    }
    if (outIndex >= 0 && fds[outIndex].revents) {
      ssize_t r = ::read(out.read(), buffer, sizeof(buffer));
      if (r > 0)
        result.out.append(buffer, static_cast<std::size_t>(r));
      else if (r == 0 || (errno != EAGAIN && errno != EINTR))
        outOpen = false;
    }
    if (errIndex >= 0 && fds[errIndex].revents) {
      ssize_t r = ::read(err.read(), buffer, sizeof(buffer));
      if (r > 0)
        result.err.append(buffer, static_cast<std::size_t>(r));
      else if (r == 0 || (errno != EAGAIN && errno != EINTR))
        errOpen = false;
    }
  }
  in.closeWrite();

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  if (WIFEXITED(status))
    result.exitCode = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exitCode = 128 + WTERMSIG(status);
  return result;
}

std::vector<std::string>
substitute(const std::vector<std::string> &args,
           const std::vector<std::pair<std::string, std::string>> &values) {
  std::vector<std::string> out;
  out.reserve(args.size());
  for (auto arg : args) {
    for (const auto &kv : values) {
      const std::string token = "{" + kv.first + "}";
      std::size_t pos = 0;
      while ((pos = arg.find(token, pos)) != std::string::npos) {
        arg.replace(pos, token.size(), kv.second);
        pos += kv.second.size();
      }
    }
    out.push_back(std::move(arg));
  }
  return out;
}

} // namespace depotsync
