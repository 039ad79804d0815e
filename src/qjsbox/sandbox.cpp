#include "sandbox.h"

#include <cstring>
#include <filesystem>

namespace {

class Reader {
  const std::vector<uint8_t>& vec_;
  size_t cur_;

  const uint8_t* Take_(size_t len) {
    if (len > vec_.size() - cur_) throw SandboxOptionsError("truncated sandbox options");
    const uint8_t* ret = vec_.data() + cur_;
    cur_ += len;
    return ret;
  }
 public:
  explicit Reader(const std::vector<uint8_t>& vec) : vec_(vec), cur_(0) {}

  template <class Int> Int ReadInt() {
    Int r;
    memcpy(&r, Take_(sizeof(Int)), sizeof(Int));
    return r;
  }
  template <class Int> std::string ReadString() {
    Int size = ReadInt<Int>();
    if (size < 0) throw SandboxOptionsError("negative string length");
    const uint8_t* ptr = Take_(size);
    return std::string(ptr, ptr + size);
  }
  template <class Int> std::vector<std::string> ReadStrings() {
    Int count = ReadInt<Int>();
    // every string takes at least its length field
    if (count < 0 || (size_t)count > vec_.size() / sizeof(Int)) {
      throw SandboxOptionsError("bad string count");
    }
    std::vector<std::string> ret(count);
    for (auto& i : ret) i = ReadString<Int>();
    return ret;
  }
};

class Writer {
  std::vector<uint8_t> buf_;
 public:
  template <class Int> void PushInt(Int r) {
    size_t cur = buf_.size();
    buf_.resize(cur + sizeof(Int));
    memcpy(buf_.data() + cur, &r, sizeof(Int));
  }
  template <class Int> void PushString(const std::string& str) {
    PushInt<Int>(str.size());
    buf_.insert(buf_.end(), str.begin(), str.end());
  }
  template <class Int> void PushStrings(const std::vector<std::string>& strs) {
    PushInt<Int>(strs.size());
    for (auto& i : strs) PushString<Int>(i);
  }
  std::vector<uint8_t> Release() { return std::move(buf_); }
};

} // namespace

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) {
  Reader rd(vec);
  box = rd.ReadString<Int>();
  argv = rd.ReadStrings<Int>();
  envs = rd.ReadStrings<Int>();
  workdir = rd.ReadString<Int>();
  fd_input = rd.ReadInt<Int>();
  fd_output = rd.ReadInt<Int>();
  fd_error = rd.ReadInt<Int>();
  uid = rd.ReadInt<Int>();
  gid = rd.ReadInt<Int>();
  wall_time = rd.ReadInt<Int>();
  cpu_time = rd.ReadInt<Int>();
  rss = rd.ReadInt<Int>();
  proc_num = rd.ReadInt<Int>();
  file_num = rd.ReadInt<Int>();
  fsize = rd.ReadInt<Int>();
  bind_dirs = rd.ReadStrings<Int>();
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  Writer wr;
  wr.PushString<Int>(box);
  wr.PushStrings<Int>(argv);
  wr.PushStrings<Int>(envs);
  wr.PushString<Int>(workdir);
  wr.PushInt<Int>(fd_input);
  wr.PushInt<Int>(fd_output);
  wr.PushInt<Int>(fd_error);
  wr.PushInt<Int>(uid);
  wr.PushInt<Int>(gid);
  wr.PushInt<Int>(wall_time);
  wr.PushInt<Int>(cpu_time);
  wr.PushInt<Int>(rss);
  wr.PushInt<Int>(proc_num);
  wr.PushInt<Int>(file_num);
  wr.PushInt<Int>(fsize);
  wr.PushStrings<Int>(bind_dirs);
  return wr.Release();
}

void SandboxOptions::FilterBindDirs() {
  std::vector<std::string> existing;
  for (auto& i : bind_dirs) {
    std::error_code ec;
    if (std::filesystem::is_directory(i, ec)) existing.push_back(std::move(i));
  }
  bind_dirs = std::move(existing);
}

std::unique_ptr<CJailContext> SandboxOptions::ToCJailContext() const {
  static char kBindType[] = "bind";
  auto ret = std::make_unique<CJailContext>();
  struct cjail_ctx& ctx = ret->ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd (other descriptors are closed), sharenet
  if (fd_input != -1) ctx.fd_input = fd_input;
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;
  for (auto& i : argv) ret->argv_.push_back(i.c_str());
  ret->argv_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret->argv_.data());
  for (auto& i : envs) ret->env_.push_back(i.c_str());
  ret->env_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret->env_.data());
  ctx.chroot = box.c_str();
  ctx.working_dir = workdir.c_str();
  ctx.cpuset = nullptr; // any CPU
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0;
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time % 1'000'000;
  // sized up front; elements must not move once added
  ret->mounts_.resize(bind_dirs.size());
  for (size_t i = 0; i < bind_dirs.size(); i++) {
    struct jail_mount_ctx& mnt = ret->mounts_[i];
    mnt.type = kBindType;
    mnt.source = mnt.target = bind_dirs[i].c_str();
    mnt.fstype = mnt.data = nullptr;
    mnt.flags = 0;
    mnt_list_add(ret->mount_list_, &mnt);
  }
  ctx.mount_cfg = ret->mount_list_;
  return ret;
}
