#ifndef INCLUDE_QJSBOX_EXECUTION_H_
#define INCLUDE_QJSBOX_EXECUTION_H_

#include <string>
#include <stdexcept>

class CompiledModule;

// limits applied to every run
extern long kTimeLimit; // us, wall clock; CPU time is limited to the same amount
extern long kMaxRSS; // KiB
extern long kMaxOutput; // KiB, per stream
extern int kMaxProcesses;
extern int kMaxFiles;
// interpreter flag that makes the next argument an inline script
extern std::string kScriptFlag;

class CaptureSetupError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

#define ENUM_STARTUP_ERROR_ \
  X(NONE) \
  X(CAPTURE_SETUP) \
  X(SANDBOX_START)
enum class StartupError {
#define X(name) name,
  ENUM_STARTUP_ERROR_
#undef X
};

struct ExecutionOutcome {
  std::string stdout_text, stderr_text;
  int exit_status; // valid only if signal == 0
  int signal; // terminating signal; 0 if the program exited by itself
  bool timed_out;
  bool oom_killed;
  StartupError startup_error;
  std::string startup_message;
  // statistics
  long time_us;
  long max_rss_kib;

  ExecutionOutcome() :
      exit_status(0), signal(0),
      timed_out(false), oom_killed(false),
      startup_error(StartupError::NONE),
      time_us(0), max_rss_kib(0) {}
};

// Run code with the interpreter in a fresh box and wait for it to finish.
// Code containing NUL, or too long for a single execve argument, is refused with SANDBOX_START.
// Safe to call from multiple threads with the same module; never throws for
//   per-run failures, which are reported through startup_error instead.
ExecutionOutcome RunScript(const std::string& code, const CompiledModule& module);

// false if the sandbox-exec helper is missing or not executable; checked once at startup
bool SandboxHelperUsable();

const char* StartupErrorName(StartupError);

#endif  // INCLUDE_QJSBOX_EXECUTION_H_
