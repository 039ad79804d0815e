#include "server_io.h"

#include <list>
#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>
#include <istream>
#include <ostream>
#include <condition_variable>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

int kMaxParallel = 4;
const char kServerName[] = "MCP QuickJS Runner";
const char kServerVersion[] = "1.0.0";
const char kLatestProtocolVersion[] = "2025-06-18";

namespace {

using nlohmann::json;

const char kInstructions[] =
    "An MCP server that provides a tool to execute JavaScript code in a QuickJS sandbox.";
const char* kSupportedProtocolVersions[] = {kLatestProtocolVersion, "2025-03-26", "2024-11-05"};

json ErrorResponse(const json& id, int code, const std::string& message) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json ResultResponse(const json& id, json result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json Initialize(const json& params) {
  std::string version = kLatestProtocolVersion;
  if (auto it = params.find("protocolVersion"); it != params.end() && it->is_string()) {
    for (const char* i : kSupportedProtocolVersions) {
      if (*it == i) version = i;
    }
    spdlog::info("Client requested protocol {}, using {}", it->get<std::string>(), version);
  }
  return {
    {"protocolVersion", version},
    {"capabilities", {{"tools", json::object()}}},
    {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
    {"instructions", kInstructions},
  };
}

json CallTool(const json& id, const json& params, const ScriptRunner& runner) {
  auto name = params.find("name");
  if (name == params.end() || !name->is_string()) {
    return ErrorResponse(id, kInvalidParams, "Missing tool name");
  }
  if (*name != kToolName) {
    return ErrorResponse(id, kInvalidParams, "Tool " + name->get<std::string>() + " not found");
  }
  auto args = params.find("arguments");
  if (args == params.end() || !args->is_object()) {
    return ErrorResponse(id, kInvalidParams,
        std::string("Invalid arguments for tool ") + kToolName + ": expected an object");
  }
  auto code = args->find(kCodeArgument);
  if (code == args->end() || !code->is_string()) {
    return ErrorResponse(id, kInvalidParams,
        std::string("Invalid arguments for tool ") + kToolName + ": " + kCodeArgument +
        " must be a string");
  }
  return ResultResponse(id, ToolResultToJson(RunJavascriptTool(code->get<std::string>(), runner)));
}

inline bool IsToolCall(const json& msg) {
  return msg.is_object() && msg.contains("id") && msg.value("method", json()) == "tools/call";
}

class Dispatcher {
  std::ostream& out_;
  const ScriptRunner& runner_;
  std::mutex out_mtx_;

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::list<json> queue_;
  bool closing_;
  std::vector<std::thread> workers_;

  void Worker_() {
    while (true) {
      json msg;
      {
        std::unique_lock lck(queue_mtx_);
        queue_cv_.wait(lck, [this]{ return closing_ || !queue_.empty(); });
        if (queue_.empty()) return;
        msg = std::move(queue_.front());
        queue_.pop_front();
      }
      if (auto resp = HandleMessage(msg, runner_)) Send(*resp);
    }
  }
 public:
  Dispatcher(std::ostream& out, const ScriptRunner& runner, int workers) :
      out_(out), runner_(runner), closing_(false) {
    for (int i = 0; i < workers; i++) workers_.emplace_back(&Dispatcher::Worker_, this);
  }
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  ~Dispatcher() { Close(); }

  void Send(const json& msg) {
    // script output is not guaranteed to be valid UTF-8
    std::string line = msg.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard lck(out_mtx_);
    out_ << line << '\n' << std::flush;
  }
  void Push(json&& msg) {
    {
      std::lock_guard lck(queue_mtx_);
      queue_.push_back(std::move(msg));
    }
    queue_cv_.notify_one();
  }
  // wait for queued requests to be answered
  void Close() {
    {
      std::lock_guard lck(queue_mtx_);
      closing_ = true;
    }
    queue_cv_.notify_all();
    for (auto& i : workers_) {
      if (i.joinable()) i.join();
    }
  }
};

} // namespace

std::optional<json> HandleMessage(const json& msg, const ScriptRunner& runner) {
  if (!msg.is_object()) return ErrorResponse(nullptr, kInvalidRequest, "Invalid Request");
  json id = msg.contains("id") ? msg["id"] : json();
  bool is_notification = !msg.contains("id");
  auto method = msg.find("method");
  if (method == msg.end() && (msg.contains("result") || msg.contains("error"))) {
    spdlog::debug("Ignoring response from client: id={}", id.dump());
    return std::nullopt;
  }
  if (msg.value("jsonrpc", json()) != "2.0" || method == msg.end() || !method->is_string() ||
      !(id.is_null() || id.is_string() || id.is_number_integer())) {
    return ErrorResponse(id, kInvalidRequest, "Invalid Request");
  }
  const std::string& name = method->get_ref<const std::string&>();
  static const json kEmptyParams = json::object();
  const json& params = msg.contains("params") && msg["params"].is_object() ? msg["params"] : kEmptyParams;
  if (is_notification) {
    spdlog::debug("Received notification {}", name);
    return std::nullopt;
  }
  spdlog::debug("Received request {} id={}", name, id.dump());
  if (name == "initialize") return ResultResponse(id, Initialize(params));
  if (name == "ping") return ResultResponse(id, json::object());
  if (name == "tools/list") return ResultResponse(id, {{"tools", json::array({ToolDefinition()})}});
  if (name == "tools/call") return CallTool(id, params, runner);
  return ErrorResponse(id, kMethodNotFound, "Method not found: " + name);
}

int ServeLoop(std::istream& in, std::ostream& out, const ScriptRunner& runner) {
  if (!in.good()) {
    spdlog::error("Input stream is not readable");
    return 1;
  }
  Dispatcher dispatcher(out, runner, std::max(kMaxParallel, 1));
  spdlog::info("MCP server is running on stdio with {} workers", std::max(kMaxParallel, 1));
  for (std::string line; std::getline(in, line);) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    json msg = json::parse(line, nullptr, false);
    if (msg.is_discarded()) {
      spdlog::warn("Failed parsing message: {:.100}", line);
      dispatcher.Send(ErrorResponse(nullptr, kParseError, "Parse error"));
    } else if (IsToolCall(msg)) {
      dispatcher.Push(std::move(msg));
    } else if (auto resp = HandleMessage(msg, runner)) {
      dispatcher.Send(*resp);
    }
  }
  spdlog::info("Input closed; waiting for running requests");
  dispatcher.Close();
  return in.bad() ? 1 : 0;
}
