#include "utils.h"

#include <unistd.h>
#include <cstdlib>
#include <fstream>
#include <qjsbox/paths.h>

bool SandboxAvailable() {
  return geteuid() == 0 && fs::exists(SandboxExecPath());
}

fs::path FindQjs() {
  if (const char* env = getenv("QJSBOX_TEST_QJS"); env && *env) {
    if (fs::is_regular_file(env)) return env;
  }
  if (fs::is_regular_file(DefaultModulePath())) return DefaultModulePath();
  return fs::path();
}

size_t CountEntries(const fs::path& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return 0;
  size_t ret = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    ret++;
  }
  return ret;
}

fs::path WriteTempFile(const std::string& name, const std::string& content) {
  fs::path ret = kBoxRoot / "files";
  fs::create_directories(ret);
  ret /= name;
  std::ofstream fout(ret, std::ios::binary);
  fout << content;
  return ret;
}

ScopedDataDir::ScopedDataDir(const fs::path& dir) : saved_(internal::kDataDir) {
  internal::kDataDir = dir;
}
ScopedDataDir::~ScopedDataDir() {
  internal::kDataDir = saved_;
}

ExecutionOutcome MakeOutcome(const std::string& out, const std::string& err, int exit_status) {
  ExecutionOutcome ret;
  ret.stdout_text = out;
  ret.stderr_text = err;
  ret.exit_status = exit_status;
  return ret;
}
