#ifndef QJSBOX_SANDBOX_H_
#define QJSBOX_SANDBOX_H_

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

#include <cjail/cjail.h>

class SandboxOptions;

// Owns everything a cjail_ctx points into. Not movable: the context holds raw
//   pointers to its own buffers.
class CJailContext {
  std::vector<const char*> argv_;
  std::vector<const char*> env_;
  std::vector<struct jail_mount_ctx> mounts_;
  struct jail_mount_list* mount_list_;
  struct cjail_ctx ctx_;
 public:
  CJailContext() : mount_list_(mnt_list_new()) {}
  CJailContext(const CJailContext&) = delete;
  CJailContext& operator=(const CJailContext&) = delete;
  ~CJailContext() {
    mnt_list_free(mount_list_);
  }
  struct cjail_ctx& Get() { return ctx_; }

  friend class SandboxOptions;
};

// thrown when a serialized option buffer is truncated
class SandboxOptionsError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One jailed run. The box is both the chroot and the parent of every mount point.
class SandboxOptions {
  using Int = int64_t; // serialize
 public:
  std::string box;
  std::vector<std::string> argv;
  // the complete environment; nothing is inherited from the server
  std::vector<std::string> envs;
  // inside the box (starts with /)
  std::string workdir;
  int fd_input, fd_output, fd_error; // -1 for not dup
  int uid, gid;
  long wall_time, cpu_time; // us
  long rss; // KiB, enforced by cgroup
  int proc_num;
  int file_num;
  long fsize; // KiB, per file
  // host directories bind-mounted at the same path inside the box
  std::vector<std::string> bind_dirs;

  SandboxOptions() :
      fd_input(-1), fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      rss(0),
      proc_num(0),
      file_num(0),
      fsize(0) {}
  // throws SandboxOptionsError
  explicit SandboxOptions(const std::vector<uint8_t>& serial);

  // drop directories that do not exist on the host
  void FilterBindDirs();
  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // the result is invalidated by any change to the string or vector members
  std::unique_ptr<CJailContext> ToCJailContext() const;
};

#endif  // QJSBOX_SANDBOX_H_
