#include "mplaunch/process.hpp"
#include "mplaunch/error.hpp"
#include "mplaunch/logger.hpp"
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mplaunch {

int Process::spawnDetached(const std::vector<std::string> &argv,
                           const std::map<std::string, std::string> &env) {
  if (argv.empty())
    throw Error(ErrorKind::LAUNCH, "Nothing to launch");

  std::vector<char *> cargv;
  for (const auto &arg : argv)
    cargv.push_back(const_cast<char *>(arg.c_str()));
  cargv.push_back(nullptr);

  // Reports the grandchild's pid, or its exec errno, back to us. CLOEXEC
  // closes it on a successful exec.
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    throw Error(ErrorKind::LAUNCH,
                "pipe failed: " + std::string(strerror(errno)));
  }

  pid_t child = fork();
  if (child == -1) {
    int err = errno;
    close(fds[0]);
    close(fds[1]);
    throw Error(ErrorKind::LAUNCH, "fork failed: " + std::string(strerror(err)));
  }

  if (child == 0) {
    close(fds[0]);
    setsid();
    pid_t grandchild = fork();
    if (grandchild != 0) {
      int report[2] = {static_cast<int>(grandchild), 0};
      if (grandchild == -1)
        report[1] = errno;
      (void)!write(fds[1], report, sizeof(report));
      _exit(grandchild == -1 ? 1 : 0);
    }
    for (const auto &[key, value] : env)
      setenv(key.c_str(), value.c_str(), 1);
    execvp(cargv[0], cargv.data());
    int report[2] = {0, errno};
    (void)!write(fds[1], report, sizeof(report));
    _exit(127);
  }

  close(fds[1]);
  int status = 0;
  waitpid(child, &status, 0);

  int pid = -1;
  int err = 0;
  int report[2];
  ssize_t n;
  while ((n = read(fds[0], report, sizeof(report))) == sizeof(report)) {
    if (report[0] > 0)
      pid = report[0];
    if (report[1] != 0)
      err = report[1];
  }
  close(fds[0]);

  if (err != 0 || pid <= 0) {
    throw Error(ErrorKind::LAUNCH, "Failed to launch " + argv[0] + ": " +
                                       std::string(strerror(err ? err : ECHILD)));
  }

  LOG_INFO("Launched " + argv[0] + " (pid " + std::to_string(pid) + ")");
  return pid;
}

std::optional<std::string> Process::captureOutput(const std::string &command) {
  FILE *pipe = popen(command.c_str(), "r");
  if (!pipe)
    return std::nullopt;

  std::string output;
  std::array<char, 4096> buf;
  size_t n;
  while ((n = fread(buf.data(), 1, buf.size(), pipe)) > 0)
    output.append(buf.data(), n);

  int status = pclose(pipe);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
    return std::nullopt;
  return output;
}

} // namespace mplaunch
