#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <iosfwd>
#include <optional>

#include <nlohmann/json_fwd.hpp>
#include "tool.h"

extern int kMaxParallel;
extern const char kServerName[];
extern const char kServerVersion[];
extern const char kLatestProtocolVersion[];

// JSON-RPC error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

// Handle one JSON-RPC message. Returns the response, or nullopt for notifications
//   and for responses sent by the client. tools/call blocks until the run finishes.
std::optional<nlohmann::json> HandleMessage(const nlohmann::json& msg, const ScriptRunner& runner);

// MCP stdio transport: one JSON message per line on `in`, responses on `out`.
// tools/call requests run on kMaxParallel worker threads, so one long-running
//   script does not hold up other requests; their responses may be written out of order.
// Returns at EOF after all accepted requests are answered; the return value is the exit code.
int ServeLoop(std::istream& in, std::ostream& out, const ScriptRunner& runner);

#endif  // SERVER_IO_H_
