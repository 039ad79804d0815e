#ifndef INCLUDE_QJSBOX_RESULT_H_
#define INCLUDE_QJSBOX_RESULT_H_

#include <string>
#include <utility>

#include "execution.h"

// ordered by severity; Classify reports the most severe condition that holds
#define ENUM_RESULT_KIND_ \
  X(SUCCESS, "Success") \
  X(STDERR_OUTPUT, "Exited normally with diagnostic output") \
  X(NONZERO_EXIT, "Exited with nonzero status") \
  X(SIGNALED, "Terminated by signal") \
  X(OUTPUT_LIMIT, "Output Limit Exceeded") \
  X(MEMORY_LIMIT, "Memory Limit Exceeded") \
  X(TIMEOUT, "Time Limit Exceeded") \
  X(SANDBOX_START_ERROR, "Sandbox failed to start") \
  X(CAPTURE_SETUP_ERROR, "Output capture setup failed") \
  X(INTERNAL_ERROR, "Internal server error")
enum class ResultKind {
#define X(name, desc) name,
  ENUM_RESULT_KIND_
#undef X
};

extern const char kStdoutLabel[];
extern const char kStderrLabel[];
extern const char kErrorLabel[];
extern const char kNoOutputMarker[];

struct ToolResult {
  std::string content;
  bool is_error;
  ResultKind kind;

  ToolResult() : is_error(false), kind(ResultKind::SUCCESS) {}
  ToolResult(std::string content, bool is_error, ResultKind kind) :
      content(std::move(content)), is_error(is_error), kind(kind) {}
};

ToolResult Classify(const ExecutionOutcome&);

// logging
const char* ResultKindName(ResultKind);
const char* ResultKindToDesc(ResultKind);

#endif  // INCLUDE_QJSBOX_RESULT_H_
