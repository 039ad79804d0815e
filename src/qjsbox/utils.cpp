#include "utils.h"

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

bool ReadFull(int fd, void* buf, size_t len) {
  auto ptr = static_cast<char*>(buf);
  while (len > 0) {
    ssize_t r = read(fd, ptr, len);
    if (r < 0 && errno == EINTR) continue;
    if (r < 0) return false;
    if (r == 0) {
      errno = EIO;
      return false;
    }
    ptr += r, len -= r;
  }
  return true;
}

bool WriteFull(int fd, const void* buf, size_t len) {
  auto ptr = static_cast<const char*>(buf);
  while (len > 0) {
    ssize_t r = write(fd, ptr, len);
    if (r < 0 && errno == EINTR) continue;
    if (r < 0) return false;
    ptr += r, len -= r;
  }
  return true;
}

fs::path MakeTempDir(const fs::path& parent, const std::string& prefix) {
  std::string tmpl = (parent / (prefix + "XXXXXX")).string();
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("Failed creating temporary directory in {}: {}", parent.c_str(), strerror(errno));
    return {};
  }
  spdlog::debug("Create temporary directory {}", tmpl);
  return tmpl;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemovePath(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete recursively {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

std::optional<std::string> ReadAll(int fd) {
  std::string ret;
  char buf[65536];
  for (off_t off = 0;;) {
    ssize_t r = pread(fd, buf, sizeof(buf), off);
    if (r < 0 && errno == EINTR) continue;
    if (r < 0) return std::nullopt;
    if (r == 0) break;
    ret.append(buf, r);
    off += r;
  }
  return ret;
}
