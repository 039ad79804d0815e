#include <errno.h>
#include <unistd.h>

#include "sandbox.h"

// sandbox-exec: reads serialized SandboxOptions from stdin, runs them through
//   cjail and writes the raw cjail_result to stdout.
// Failures of cjail itself are reported as timekill = -1, oomkill = errno.

namespace {

bool ReadFull(int fd, void* buf, size_t len) {
  auto ptr = static_cast<char*>(buf);
  while (len > 0) {
    ssize_t r = read(fd, ptr, len);
    if (r < 0 && errno == EINTR) continue;
    if (r <= 0) return false;
    ptr += r, len -= r;
  }
  return true;
}

struct cjail_result RunJailed(const std::vector<uint8_t>& serial) {
  struct cjail_result ret = {};
  try {
    // ctx points into opt
    SandboxOptions opt(serial);
    auto ctx = opt.ToCJailContext();
    if (cjail_exec(&ctx->Get(), &ret) < 0) {
      ret.oomkill = errno;
      ret.timekill = -1;
    }
  } catch (const SandboxOptionsError&) {
    ret = {};
    ret.oomkill = EINVAL;
    ret.timekill = -1;
  }
  return ret;
}

} // namespace

int main() {
  int64_t sz = 0;
  if (!ReadFull(0, &sz, sizeof(sz)) || sz < 0) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadFull(0, buf.data(), sz)) return 1;
  struct cjail_result res = RunJailed(buf);
  if (write(1, &res, sizeof(res)) != sizeof(res)) return 1;
}
