#ifndef TOOL_H_
#define TOOL_H_

#include <string>
#include <functional>

#include <nlohmann/json_fwd.hpp>
#include <qjsbox/result.h>

extern const char kToolName[];
extern const char kCodeArgument[];

// RunScript bound to the loaded module; replaceable in tests
using ScriptRunner = std::function<ExecutionOutcome(const std::string& code)>;

// name, description and input schema as listed by tools/list
nlohmann::json ToolDefinition();

// Run and classify. Never throws: any fault escaping the runner or the classifier
//   becomes an INTERNAL_ERROR result, so a single request cannot take down the server.
ToolResult RunJavascriptTool(const std::string& code, const ScriptRunner& runner);

// {"content": [{"type": "text", "text": ...}], "isError": ...}
nlohmann::json ToolResultToJson(const ToolResult&);

#endif  // TOOL_H_
