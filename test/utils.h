#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <filesystem>
#include <gtest/gtest.h>
#include <qjsbox/execution.h>

namespace fs = std::filesystem;

// running jailed programs needs root and the sandbox-exec helper next to the test binary
bool SandboxAvailable();

// QuickJS binary for end-to-end tests: $QJSBOX_TEST_QJS, or the installed default;
//   empty if neither exists
fs::path FindQjs();

size_t CountEntries(const fs::path& dir);
fs::path WriteTempFile(const std::string& name, const std::string& content);

// restores the run limits and the script flag when the test ends
class ScopedLimits {
  long time_limit_, max_rss_, max_output_;
  int max_processes_;
  std::string script_flag_;
 public:
  ScopedLimits() :
      time_limit_(kTimeLimit), max_rss_(kMaxRSS), max_output_(kMaxOutput),
      max_processes_(kMaxProcesses), script_flag_(kScriptFlag) {}
  ~ScopedLimits() {
    kTimeLimit = time_limit_;
    kMaxRSS = max_rss_;
    kMaxOutput = max_output_;
    kMaxProcesses = max_processes_;
    kScriptFlag = script_flag_;
  }
};

// points the data dir (where sandbox-exec is looked up) elsewhere for one test
class ScopedDataDir {
  fs::path saved_;
 public:
  explicit ScopedDataDir(const fs::path& dir);
  ~ScopedDataDir();
};

ExecutionOutcome MakeOutcome(const std::string& out, const std::string& err, int exit_status = 0);

#endif // TEST_UTILS_H_
