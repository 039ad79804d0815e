#include <stdexcept>
#include <nlohmann/json.hpp>

#include "tool.h"
#include "utils.h"

using nlohmann::json;

TEST(Tool, Definition) {
  json def = ToolDefinition();
  EXPECT_EQ(def["name"], "run_javascript_code");
  EXPECT_TRUE(def["description"].is_string());
  auto& schema = def["inputSchema"];
  EXPECT_EQ(schema["type"], "object");
  EXPECT_EQ(schema["properties"]["javascript_code"]["type"], "string");
  EXPECT_EQ(schema["required"], json::array({"javascript_code"}));
}

TEST(Tool, PassesCode) {
  std::string received;
  ToolResult res = RunJavascriptTool("console.log('hi')", [&](const std::string& code) {
    received = code;
    return MakeOutcome("hi\n", "");
  });
  EXPECT_EQ(received, "console.log('hi')");
  EXPECT_EQ(res.kind, ResultKind::SUCCESS);
  EXPECT_FALSE(res.is_error);
  EXPECT_EQ(res.content, "--- stdout ---\nhi");
}

TEST(Tool, RunnerThrows) {
  ToolResult res = RunJavascriptTool("1", [](const std::string&) -> ExecutionOutcome {
    throw std::runtime_error("uid pool exhausted");
  });
  EXPECT_EQ(res.kind, ResultKind::INTERNAL_ERROR);
  EXPECT_TRUE(res.is_error);
  EXPECT_EQ(res.content, "Internal server error during execution: uid pool exhausted");
}

TEST(Tool, ResultJson) {
  json j = ToolResultToJson(ToolResult("--- stderr ---\nboom", true, ResultKind::STDERR_OUTPUT));
  EXPECT_EQ(j, json::parse(R"({"content":[{"type":"text","text":"--- stderr ---\nboom"}],"isError":true})"));
  j = ToolResultToJson(ToolResult("--- Execution Success (No Output) ---", false, ResultKind::SUCCESS));
  EXPECT_EQ(j["isError"], false);
  EXPECT_EQ(j["content"].size(), 1u);
}
