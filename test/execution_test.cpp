#include <signal.h>
#include <thread>
#include <vector>
#include <qjsbox/module.h>
#include <qjsbox/paths.h>
#include <qjsbox/result.h>

#include "paths.h"
#include "utils.h"

// The jail is exercised with /bin/sh standing in for the interpreter, so these
//   tests do not depend on a QuickJS build; the QuickJS cases run only if one is found.
class ShellSandbox : public testing::Test {
 protected:
  static std::shared_ptr<const CompiledModule> module_;
  ScopedLimits limits_;

  static void SetUpTestSuite() {
    if (SandboxAvailable()) module_ = LoadModule("/bin/sh");
  }
  static void TearDownTestSuite() {
    module_.reset();
  }
  void SetUp() override {
    if (!module_) GTEST_SKIP() << "sandbox needs root and " << SandboxExecPath();
    kScriptFlag = "-c";
    kTimeLimit = 2'000'000;
  }
  ExecutionOutcome Run(const std::string& code) {
    return RunScript(code, *module_);
  }
};
std::shared_ptr<const CompiledModule> ShellSandbox::module_;

TEST_F(ShellSandbox, Stdout) {
  auto outcome = Run("echo hi");
  EXPECT_EQ(outcome.startup_error, StartupError::NONE) << outcome.startup_message;
  EXPECT_EQ(outcome.stdout_text, "hi\n");
  EXPECT_EQ(outcome.stderr_text, "");
  EXPECT_EQ(outcome.exit_status, 0);
  ToolResult res = Classify(outcome);
  EXPECT_FALSE(res.is_error);
  EXPECT_EQ(res.content, "--- stdout ---\nhi");
}

TEST_F(ShellSandbox, NoOutput) {
  ToolResult res = Classify(Run("true"));
  EXPECT_FALSE(res.is_error);
  EXPECT_EQ(res.content, kNoOutputMarker);
}

TEST_F(ShellSandbox, SeparateStreams) {
  auto outcome = Run("echo out; echo err >&2; echo out2");
  EXPECT_EQ(outcome.stdout_text, "out\nout2\n");
  EXPECT_EQ(outcome.stderr_text, "err\n");
  ToolResult res = Classify(outcome);
  EXPECT_EQ(res.kind, ResultKind::STDERR_OUTPUT);
  EXPECT_TRUE(res.is_error);
}

TEST_F(ShellSandbox, ExitCode) {
  auto outcome = Run("echo partial; exit 3");
  EXPECT_EQ(outcome.exit_status, 3);
  EXPECT_EQ(outcome.signal, 0);
  ToolResult res = Classify(outcome);
  EXPECT_EQ(res.kind, ResultKind::NONZERO_EXIT);
  EXPECT_EQ(res.content, "--- stdout ---\npartial\n\n--- Execution Error ---\nProcess exited with code 3");
}

TEST_F(ShellSandbox, StdinIsEmpty) {
  // reading stdin must see EOF instead of the server's protocol stream
  auto outcome = Run("cat; echo done");
  EXPECT_FALSE(outcome.timed_out);
  EXPECT_EQ(outcome.stdout_text, "done\n");
}

TEST_F(ShellSandbox, Timeout) {
  kTimeLimit = 500'000;
  auto outcome = Run("echo started; while :; do :; done");
  EXPECT_TRUE(outcome.timed_out);
  EXPECT_EQ(outcome.stdout_text, "started\n");
  ToolResult res = Classify(outcome);
  EXPECT_EQ(res.kind, ResultKind::TIMEOUT);
  EXPECT_NE(res.content.find("Execution timed out after 500 ms"), std::string::npos);
}

TEST_F(ShellSandbox, OutputLimit) {
  kMaxOutput = 64;
  auto outcome = Run("exec yes");
  EXPECT_EQ(outcome.signal, SIGXFSZ);
  EXPECT_LE(outcome.stdout_text.size(), 64u * 1024);
  EXPECT_EQ(Classify(outcome).kind, ResultKind::OUTPUT_LIMIT);
}

TEST_F(ShellSandbox, Isolation) {
  // only the system directories and the staged binary are visible
  auto outcome = Run("test -e /root || test -e /home || echo isolated; test -w / || echo readonly");
  EXPECT_EQ(outcome.stdout_text, "isolated\nreadonly\n");
}

TEST_F(ShellSandbox, Concurrent) {
  constexpr int kRuns = 6;
  std::vector<ExecutionOutcome> outcomes(kRuns);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRuns; i++) {
    threads.emplace_back([&, i]() {
      outcomes[i] = Run("echo marker_" + std::to_string(i) + "; echo err_" + std::to_string(i) + " >&2");
    });
  }
  for (auto& i : threads) i.join();
  for (int i = 0; i < kRuns; i++) {
    EXPECT_EQ(outcomes[i].stdout_text, "marker_" + std::to_string(i) + "\n");
    EXPECT_EQ(outcomes[i].stderr_text, "err_" + std::to_string(i) + "\n");
  }
}

TEST_F(ShellSandbox, NoLeftovers) {
  for (int i = 0; i < 3; i++) Run("echo x");
  Run("exit 1");
  EXPECT_EQ(CountEntries(RunRoot()), 0u);
}

class QuickJSSandbox : public testing::Test {
 protected:
  static std::shared_ptr<const CompiledModule> module_;

  static void SetUpTestSuite() {
    fs::path qjs = FindQjs();
    if (SandboxAvailable() && !qjs.empty()) module_ = LoadModule(qjs);
  }
  static void TearDownTestSuite() {
    module_.reset();
  }
  void SetUp() override {
    if (!module_) GTEST_SKIP() << "no QuickJS binary; set QJSBOX_TEST_QJS";
  }
};
std::shared_ptr<const CompiledModule> QuickJSSandbox::module_;

TEST_F(QuickJSSandbox, ConsoleLog) {
  ToolResult res = Classify(RunScript("console.log(\"hi\")", *module_));
  EXPECT_FALSE(res.is_error);
  EXPECT_EQ(res.content, "--- stdout ---\nhi");
}

TEST_F(QuickJSSandbox, Empty) {
  ToolResult res = Classify(RunScript("", *module_));
  EXPECT_FALSE(res.is_error);
  EXPECT_EQ(res.content, kNoOutputMarker);
}

TEST_F(QuickJSSandbox, Uncaught) {
  ToolResult res = Classify(RunScript("throw new Error(\"boom\")", *module_));
  EXPECT_TRUE(res.is_error);
  EXPECT_NE(res.content.find("--- stderr ---"), std::string::npos);
  EXPECT_NE(res.content.find("boom"), std::string::npos);
}
