#include "capture.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>
#include <qjsbox/execution.h>
#include "paths.h"
#include "utils.h"

namespace {

int OpenCaptureFile(const fs::path& path) {
  return open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_TRUNC | O_CLOEXEC, 0600);
}

std::string ReadCaptureFile(const fs::path& path) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    spdlog::warn("Failed opening capture file {}: {}", path.c_str(), strerror(errno));
    return "";
  }
  auto content = ReadAll(fd);
  if (!content) spdlog::warn("Failed reading capture file {}: {}", path.c_str(), strerror(errno));
  close(fd);
  return content ? std::move(*content) : "";
}

} // namespace

CaptureChannel::CaptureChannel() : stdout_fd_(-1), stderr_fd_(-1), released_(false) {
  if (!CreateDirs(RunRoot(), kPerm755)) {
    throw CaptureSetupError("cannot create run directory " + RunRoot().string());
  }
  box_ = MakeTempDir(RunRoot(), "box_");
  if (box_.empty()) {
    throw CaptureSetupError(std::string("cannot allocate box: ") + strerror(errno));
  }
  created_.push_back(box_);
  std::error_code ec;
  // chroot root must be traversable by the sandbox uid
  fs::permissions(box_, kPerm755, ec);
  if (ec || !MakeDir_(CaptureDir(box_), fs::perms::owner_all) ||
      !MakeDir_(Workdir(box_), kPerm755)) {
    Release();
    throw CaptureSetupError("cannot prepare box " + box_.string());
  }
  stdout_fd_ = OpenCaptureFile(CaptureStdout(box_));
  if (stdout_fd_ >= 0) created_.push_back(CaptureStdout(box_));
  stderr_fd_ = OpenCaptureFile(CaptureStderr(box_));
  if (stderr_fd_ >= 0) created_.push_back(CaptureStderr(box_));
  if (stdout_fd_ < 0 || stderr_fd_ < 0) {
    int err = errno;
    Release();
    throw CaptureSetupError(std::string("cannot create capture files: ") + strerror(err));
  }
  spdlog::debug("Capture channel opened in {}", box_.c_str());
}

bool CaptureChannel::MakeDir_(const fs::path& path, fs::perms perms) {
  std::error_code ec;
  if (!fs::create_directory(path, ec) || ec) {
    spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec ? ec.message() : "exists");
    return false;
  }
  created_.push_back(path);
  fs::permissions(path, perms, ec);
  return !ec;
}

bool CaptureChannel::AddDir(const fs::path& path, fs::perms perms) {
  fs::path rel = path.lexically_relative(box_);
  if (rel.empty() || *rel.begin() == "..") return false;
  fs::path cur = box_;
  for (auto& part : rel) {
    cur /= part;
    std::error_code ec;
    if (fs::is_directory(cur, ec)) continue;
    if (!MakeDir_(cur, perms)) return false;
  }
  return true;
}

CaptureChannel::Output CaptureChannel::Finalize() {
  for (int* fd : {&stdout_fd_, &stderr_fd_}) {
    if (*fd >= 0) close(*fd);
    *fd = -1;
  }
  Output ret;
  if (released_) return ret;
  ret.stdout_text = ReadCaptureFile(CaptureStdout(box_));
  ret.stderr_text = ReadCaptureFile(CaptureStderr(box_));
  return ret;
}

void CaptureChannel::Release() {
  if (released_) return;
  released_ = true;
  for (int* fd : {&stdout_fd_, &stderr_fd_}) {
    if (*fd >= 0) close(*fd);
    *fd = -1;
  }
  // never recurse: a bind mount that is still attached must not be descended into
  for (auto it = created_.rbegin(); it != created_.rend(); ++it) RemovePath(*it);
  created_.clear();
  spdlog::debug("Capture channel released {}", box_.c_str());
}
