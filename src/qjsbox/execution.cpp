#include <qjsbox/execution.h>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <condition_variable>

#include <spdlog/spdlog.h>
#include <qjsbox/module.h>
#include <qjsbox/paths.h>
#include "capture.h"
#include "paths.h"
#include "sandbox_exec.h"
#include "utils.h"

long kTimeLimit = 10'000'000; // 10s
long kMaxRSS = 256 * 1024; // 256M
long kMaxOutput = 16 * 1024; // 16M
int kMaxProcesses = 4;
int kMaxFiles = 64;
std::string kScriptFlag = "-e";

namespace {

// every concurrent run gets its own uid so that runs cannot signal or ptrace each other
constexpr int kUidBase = 50000, kUidPoolSize = 100;

class UidPool {
  std::mutex mtx_;
  std::condition_variable cv_;
  std::vector<int> free_;
 public:
  UidPool() {
    for (int i = kUidPoolSize - 1; i >= 0; i--) free_.push_back(i + kUidBase);
  }
  int Acquire() {
    std::unique_lock lck(mtx_);
    cv_.wait(lck, [this]{ return !free_.empty(); });
    int uid = free_.back();
    free_.pop_back();
    return uid;
  }
  void Release(int uid) {
    {
      std::lock_guard lck(mtx_);
      free_.push_back(uid);
    }
    cv_.notify_one();
  }
};
UidPool uid_pool;

class UidLease {
  int uid_;
 public:
  UidLease() : uid_(uid_pool.Acquire()) {}
  UidLease(const UidLease&) = delete;
  UidLease& operator=(const UidLease&) = delete;
  ~UidLease() { uid_pool.Release(uid_); }
  int Get() const { return uid_; }
};

class ScopedFd {
  int fd_;
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  ~ScopedFd() { if (fd_ >= 0) close(fd_); }
  int Get() const { return fd_; }
};

// MAX_ARG_STRLEN: longest single execve argument, including the terminating NUL
constexpr size_t kMaxArgLength = 32 * 4096;

const std::vector<std::string> kSystemDirs = {"/usr", "/lib", "/lib64", "/bin", "/etc/alternatives"};

inline long ToUs(const struct timeval& v) {
  return (long)v.tv_sec * 1'000'000 + v.tv_usec;
}

inline std::string Preview(const std::string& code) {
  constexpr size_t kPreviewLength = 50;
  std::string ret = code.substr(0, kPreviewLength);
  for (auto& c : ret) {
    if (c == '\n' || c == '\r' || c == '\t') c = ' ';
  }
  return code.size() > kPreviewLength ? ret + "..." : ret;
}

SandboxOptions ScriptOptions(const std::string& code, const CompiledModule& module,
                             const CaptureChannel& channel) {
  SandboxOptions opt;
  opt.box = channel.BoxDir();
  opt.argv = {module.Program(), kScriptFlag, code};
  if (char* path = getenv("PATH")) opt.envs.push_back(std::string("PATH=") + path);
  opt.workdir = Workdir(channel.BoxDir(), true);
  opt.fd_output = channel.StdoutFd();
  opt.fd_error = channel.StderrFd();
  opt.wall_time = kTimeLimit;
  opt.cpu_time = kTimeLimit;
  opt.rss = kMaxRSS;
  opt.proc_num = kMaxProcesses;
  opt.file_num = kMaxFiles;
  opt.fsize = kMaxOutput;
  opt.bind_dirs = kSystemDirs;
  opt.FilterBindDirs();
  opt.bind_dirs.push_back(module.StagingDir());
  return opt;
}

void ParseCJailResult(const struct cjail_result& res, ExecutionOutcome& ret) {
  if (res.timekill == -1) {
    // timekill = -1 means SandboxExec error (see sandbox_exec.cpp, sandbox_main.cpp)
    ret.startup_error = StartupError::SANDBOX_START;
    ret.startup_message = std::string("sandbox failed to start: ") + strerror(res.oomkill);
    return;
  }
  ret.time_us = ToUs(res.time);
  ret.max_rss_kib = res.rus.ru_maxrss;
  if (res.oomkill > 0) {
    // oomkill = -1 means failed to read oom (see cjail/cjail.h)
    ret.oom_killed = true;
  } else if (res.timekill) {
    ret.timed_out = true;
  } else if (res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED) {
    ret.signal = res.info.si_status;
  } else {
    ret.exit_status = res.info.si_status;
  }
}

} // namespace

ExecutionOutcome RunScript(const std::string& code, const CompiledModule& module) {
  spdlog::info("[Sandbox] Executing code starting with: \"{}\"", Preview(code));
  ExecutionOutcome ret;
  // the code is passed as an argv element
  if (code.find('\0') != std::string::npos) {
    ret.startup_error = StartupError::SANDBOX_START;
    ret.startup_message = "sandbox failed to start: the code contains a NUL character";
    return ret;
  }
  if (code.size() >= kMaxArgLength) {
    ret.startup_error = StartupError::SANDBOX_START;
    ret.startup_message = fmt::format("sandbox failed to start: the code is {} bytes long; "
                                      "at most {} bytes are accepted", code.size(), kMaxArgLength - 1);
    return ret;
  }
  std::unique_ptr<CaptureChannel> channel;
  try {
    channel = std::make_unique<CaptureChannel>();
  } catch (const CaptureSetupError& err) {
    spdlog::warn("[Sandbox] Capture setup failed: {}", err.what());
    ret.startup_error = StartupError::CAPTURE_SETUP;
    ret.startup_message = std::string("cannot set up output capture: ") + err.what();
    return ret;
  }

  SandboxOptions opt = ScriptOptions(code, module, *channel);
  ScopedFd devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
  bool prepared = devnull.Get() >= 0;
  for (auto& dir : opt.bind_dirs) {
    if (!prepared) break;
    prepared = channel->AddDir(MountPoint(channel->BoxDir(), dir), kPerm755);
  }
  if (!prepared) {
    ret.startup_error = StartupError::SANDBOX_START;
    ret.startup_message = "sandbox failed to start: cannot prepare box " + channel->BoxDir().string();
  } else {
    opt.fd_input = devnull.Get();
    UidLease uid;
    opt.uid = opt.gid = uid.Get();
    ParseCJailResult(SandboxExec(opt), ret);
  }

  // the helper has exited, so nothing writes to the capture files anymore
  auto output = channel->Finalize();
  channel->Release();
  ret.stdout_text = std::move(output.stdout_text);
  ret.stderr_text = std::move(output.stderr_text);
  spdlog::info("[Sandbox] Execution finished: exit={} signal={} timeout={} oom={} startup_error={} "
               "time={}us rss={}KiB stdout={}B stderr={}B",
               ret.exit_status, ret.signal, ret.timed_out, ret.oom_killed,
               StartupErrorName(ret.startup_error), ret.time_us, ret.max_rss_kib,
               ret.stdout_text.size(), ret.stderr_text.size());
  return ret;
}

bool SandboxHelperUsable() {
  if (access(SandboxExecPath().c_str(), X_OK) < 0) {
    spdlog::warn("Sandbox helper {} is not executable: {}", SandboxExecPath().c_str(), strerror(errno));
    return false;
  }
  return true;
}

#define X(name) case StartupError::name: return #name;
const char* StartupErrorName(StartupError err) {
  switch (err) {
    ENUM_STARTUP_ERROR_
  }
  __builtin_unreachable();
}
#undef X
