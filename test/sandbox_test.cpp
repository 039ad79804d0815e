#include "sandbox.h"
#include "utils.h"

namespace {

SandboxOptions ExampleOptions() {
  SandboxOptions opt;
  opt.box = "/tmp/qjsbox/run/box_abcdef";
  opt.argv = {"/tmp/qjsbox/module/module_abcdef/qjs", "-e", std::string("print(1)\0x", 10)};
  opt.envs = {"PATH=/usr/bin:/bin"};
  opt.workdir = "/workdir";
  opt.fd_input = 3;
  opt.fd_output = 4;
  opt.fd_error = 5;
  opt.uid = opt.gid = 50001;
  opt.wall_time = opt.cpu_time = 10'000'000;
  opt.rss = 262144;
  opt.proc_num = 4;
  opt.file_num = 64;
  opt.fsize = 16384;
  opt.bind_dirs = {"/usr", "/tmp/qjsbox/module/module_abcdef"};
  return opt;
}

} // namespace

TEST(SandboxOptions, Serialize) {
  SandboxOptions opt = ExampleOptions();
  SandboxOptions copy(opt.Serialize());
  EXPECT_EQ(copy.box, opt.box);
  EXPECT_EQ(copy.argv, opt.argv);
  EXPECT_EQ(copy.argv[2].size(), 10u);
  EXPECT_EQ(copy.envs, opt.envs);
  EXPECT_EQ(copy.workdir, opt.workdir);
  EXPECT_EQ(copy.fd_output, 4);
  EXPECT_EQ(copy.uid, 50001);
  EXPECT_EQ(copy.wall_time, 10'000'000);
  EXPECT_EQ(copy.fsize, 16384);
  EXPECT_EQ(copy.bind_dirs, opt.bind_dirs);
}

TEST(SandboxOptions, Truncated) {
  auto serial = ExampleOptions().Serialize();
  for (size_t len : {(size_t)0, (size_t)5, serial.size() / 2, serial.size() - 1}) {
    std::vector<uint8_t> part(serial.begin(), serial.begin() + len);
    EXPECT_THROW(SandboxOptions opt(part), SandboxOptionsError) << "length " << len;
  }
}

TEST(SandboxOptions, NegativeLength) {
  std::vector<uint8_t> serial(sizeof(int64_t) * 2, 0xff);
  EXPECT_THROW(SandboxOptions opt(serial), SandboxOptionsError);
}

TEST(SandboxOptions, FilterBindDirs) {
  SandboxOptions opt;
  opt.bind_dirs = {"/usr", "/no/such/dir", "/etc/passwd"};
  opt.FilterBindDirs();
  EXPECT_EQ(opt.bind_dirs, std::vector<std::string>{"/usr"});
}
