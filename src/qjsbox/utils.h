#ifndef QJSBOX_UTILS_H_
#define QJSBOX_UTILS_H_

#include <string>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;
constexpr fs::perms kPerm555 =
    fs::perms::owner_read | fs::perms::owner_exec |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

// retry on EINTR and short transfers; false on error or EOF (errno = EIO on EOF)
bool ReadFull(int fd, void* buf, size_t len);
bool WriteFull(int fd, const void* buf, size_t len);

// create a uniquely named directory "<parent>/<prefix>XXXXXX"; empty path on failure
fs::path MakeTempDir(const fs::path& parent, const std::string& prefix);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
// remove a single file or empty directory; never recursive
bool RemovePath(const fs::path&);
bool RemoveAll(const fs::path&);
// read the whole content of a descriptor from offset 0
std::optional<std::string> ReadAll(int fd);

#endif  // QJSBOX_UTILS_H_
