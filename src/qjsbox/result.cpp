#include <qjsbox/result.h>

#include <signal.h>
#include <cstring>

#include <fmt/format.h>
#include <qjsbox/execution.h>

const char kStdoutLabel[] = "--- stdout ---";
const char kStderrLabel[] = "--- stderr ---";
const char kErrorLabel[] = "--- Execution Error ---";
const char kNoOutputMarker[] = "--- Execution Success (No Output) ---";

namespace {

inline bool IsBlank(const std::string& str) {
  return str.find_first_not_of(" \t\n\v\f\r") == std::string::npos;
}

inline std::string Trim(const std::string& str) {
  constexpr char kSpaces[] = " \t\n\v\f\r";
  size_t begin = str.find_first_not_of(kSpaces);
  if (begin == std::string::npos) return "";
  size_t end = str.find_last_not_of(kSpaces);
  return str.substr(begin, end - begin + 1);
}

inline void AppendBlock(std::string& content, const char* label, const std::string& text) {
  if (text.empty()) return;
  content += label;
  content += '\n';
  content += text;
  content += '\n';
}

ResultKind KindOf(const ExecutionOutcome& outcome) {
  switch (outcome.startup_error) {
    case StartupError::CAPTURE_SETUP: return ResultKind::CAPTURE_SETUP_ERROR;
    case StartupError::SANDBOX_START: return ResultKind::SANDBOX_START_ERROR;
    case StartupError::NONE: break;
  }
  if (outcome.timed_out) return ResultKind::TIMEOUT;
  if (outcome.oom_killed) return ResultKind::MEMORY_LIMIT;
  if (outcome.signal == SIGXFSZ) return ResultKind::OUTPUT_LIMIT;
  if (outcome.signal != 0) return ResultKind::SIGNALED;
  if (outcome.exit_status != 0) return ResultKind::NONZERO_EXIT;
  if (!IsBlank(outcome.stderr_text)) return ResultKind::STDERR_OUTPUT;
  return ResultKind::SUCCESS;
}

std::string ErrorMessage(ResultKind kind, const ExecutionOutcome& outcome) {
  switch (kind) {
    case ResultKind::CAPTURE_SETUP_ERROR: [[fallthrough]];
    case ResultKind::SANDBOX_START_ERROR:
      return outcome.startup_message;
    case ResultKind::TIMEOUT:
      return fmt::format("Execution timed out after {} ms", kTimeLimit / 1000);
    case ResultKind::MEMORY_LIMIT:
      return fmt::format("Memory limit of {} KiB exceeded", kMaxRSS);
    case ResultKind::OUTPUT_LIMIT:
      return fmt::format("Output limit of {} KiB exceeded", kMaxOutput);
    case ResultKind::SIGNALED:
      return fmt::format("Process terminated by signal {} ({})", outcome.signal, strsignal(outcome.signal));
    case ResultKind::NONZERO_EXIT:
      return fmt::format("Process exited with code {}", outcome.exit_status);
    case ResultKind::STDERR_OUTPUT: [[fallthrough]];
    case ResultKind::SUCCESS: [[fallthrough]];
    case ResultKind::INTERNAL_ERROR:
      return "";
  }
  __builtin_unreachable();
}

} // namespace

ToolResult Classify(const ExecutionOutcome& outcome) {
  ResultKind kind = KindOf(outcome);
  std::string content;
  AppendBlock(content, kStdoutLabel, outcome.stdout_text);
  AppendBlock(content, kStderrLabel, outcome.stderr_text);
  AppendBlock(content, kErrorLabel, ErrorMessage(kind, outcome));
  if (content.empty()) return ToolResult(kNoOutputMarker, false, kind);
  return ToolResult(Trim(content), kind != ResultKind::SUCCESS, kind);
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG1(ResultKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ResultKindName, ResultKind, ENUM_RESULT_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(ResultKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ResultKindToDesc, ResultKind, ENUM_RESULT_KIND_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
