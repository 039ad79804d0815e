#include "tool.h"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

const char kToolName[] = "run_javascript_code";
const char kCodeArgument[] = "javascript_code";

nlohmann::json ToolDefinition() {
  return {
    {"name", kToolName},
    {"description", "Executes the provided JavaScript code in a secure sandbox (QuickJS). "
                    "Returns stdout and stderr."},
    {"inputSchema", {
      {"type", "object"},
      {"properties", {
        {kCodeArgument, {
          {"type", "string"},
          {"description", "The JavaScript code to execute in the sandbox."},
        }},
      }},
      {"required", nlohmann::json::array({kCodeArgument})},
      {"additionalProperties", false},
    }},
  };
}

ToolResult RunJavascriptTool(const std::string& code, const ScriptRunner& runner) {
  spdlog::info("Received request to run tool '{}'", kToolName);
  try {
    ToolResult res = Classify(runner(code));
    if (res.is_error) {
      spdlog::warn("Tool '{}' execution finished with errors: {}", kToolName, ResultKindToDesc(res.kind));
    } else {
      spdlog::info("Tool '{}' execution finished successfully", kToolName);
    }
    return res;
  } catch (const std::exception& err) {
    spdlog::error("Unhandled error in tool '{}' handler: {}", kToolName, err.what());
    return ToolResult(std::string("Internal server error during execution: ") + err.what(),
                      true, ResultKind::INTERNAL_ERROR);
  }
}

nlohmann::json ToolResultToJson(const ToolResult& res) {
  return {
    {"content", nlohmann::json::array({
      {{"type", "text"}, {"text", res.content}},
    })},
    {"isError", res.is_error},
  };
}
