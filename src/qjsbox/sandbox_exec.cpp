#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <qjsbox/paths.h>
#include "utils.h"

namespace {

// only async-signal-safe calls between fork() and exec
[[noreturn]] void ExecHelper(const char* cmd, int in_fd, int out_fd, const SandboxOptions& opt) {
  if (dup2(in_fd, 0) < 0 || dup2(out_fd, 1) < 0) _exit(1);
  // the server ignores SIGPIPE; the sandboxed program gets the default
  signal(SIGPIPE, SIG_DFL);
  for (int fd : {opt.fd_input, opt.fd_output, opt.fd_error}) {
    if (fd != -1 && fcntl(fd, F_SETFD, 0) < 0) _exit(1);
  }
  execl(cmd, cmd, nullptr);
  _exit(1);
}

} // namespace

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  struct cjail_result ret = {};
  // to_helper: options; from_helper: cjail_result
  int to_helper[2] = {-1, -1}, from_helper[2] = {-1, -1};
  const std::string cmd = SandboxExecPath();
  const std::vector<uint8_t> vec = opt.Serialize();
  const int64_t size = vec.size();
  pid_t pid;
  int err;
  if (pipe2(to_helper, O_CLOEXEC) < 0 || pipe2(from_helper, O_CLOEXEC) < 0) goto err;
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) ExecHelper(cmd.c_str(), to_helper[0], from_helper[1], opt);

  spdlog::debug("cjail_exec pid={} childpid={} box={} uid={} argv={}",
      getpid(), pid, opt.box, opt.uid, fmt::format("{}", opt.argv));
  close(to_helper[0]);
  close(from_helper[1]);
  to_helper[0] = from_helper[1] = -1;
  if (!WriteFull(to_helper[1], &size, sizeof(size)) ||
      !WriteFull(to_helper[1], vec.data(), vec.size()) ||
      !ReadFull(from_helper[0], &ret, sizeof(ret))) {
    err = errno;
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    errno = err;
    goto err;
  }
  close(to_helper[1]);
  close(from_helper[0]);
  waitpid(pid, nullptr, 0);
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
err:
  err = errno ? errno : EIO;
  spdlog::warn("SandboxExec error: errno={} {}", err, strerror(err));
  for (int fd : {to_helper[0], to_helper[1], from_helper[0], from_helper[1]}) {
    if (fd != -1) close(fd);
  }
  ret = {};
  ret.oomkill = err;
  ret.timekill = -1;
  return ret;
}
