#include "paths.h"

#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>
#include "utils.h"

fs::path kBoxRoot = "/tmp/qjsbox";

namespace internal {
fs::path kDataDir = fs::path(QJSBOX_DATA_DIR);
} // internal

bool PrepareBoxRoot() {
  if (!CreateDirs(kBoxRoot)) return false;
  struct stat st;
  if (lstat(kBoxRoot.c_str(), &st) < 0) {
    spdlog::warn("Cannot stat box root {}: {}", kBoxRoot.c_str(), strerror(errno));
    return false;
  }
  if (!S_ISDIR(st.st_mode)) {
    spdlog::warn("Box root {} is not a directory", kBoxRoot.c_str());
    return false;
  }
  if (st.st_uid != geteuid()) {
    spdlog::warn("Box root {} is owned by uid {}", kBoxRoot.c_str(), st.st_uid);
    return false;
  }
  if (st.st_mode & (S_IWGRP | S_IWOTH)) {
    spdlog::warn("Box root {} is writable by other users (mode {:o})",
        kBoxRoot.c_str(), st.st_mode & 07777);
    return false;
  }
  return true;
}

fs::path DefaultModulePath() {
  return internal::kDataDir / "qjs";
}
fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}

fs::path ModuleRoot() {
  return kBoxRoot / "module";
}
fs::path RunRoot() {
  return kBoxRoot / "run";
}

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(const fs::path& box, bool inside_box) {
  return (inside_box ? fs::path("/") : box) / kWorkdirRelative;
}

fs::path CaptureDir(const fs::path& box) {
  return box / "capture";
}
fs::path CaptureStdout(const fs::path& box) {
  return CaptureDir(box) / "stdout";
}
fs::path CaptureStderr(const fs::path& box) {
  return CaptureDir(box) / "stderr";
}

fs::path MountPoint(const fs::path& box, const fs::path& host_dir) {
  return box / host_dir.lexically_relative("/");
}
