#ifndef MCPWS_ERRORS_HPP_
#define MCPWS_ERRORS_HPP_

#include <json/json.h>

#include <string>
#include <utility>

namespace mcpws {

// JSON-RPC 2.0 reserved codes plus the server's own range.
namespace rpc_code {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kRequestTimeout = -32001;
constexpr int kServerNotInitialized = -32002;
constexpr int kQueueFull = -32003;
constexpr int kRequestCancelled = -32800;
}  // namespace rpc_code

constexpr size_t kMaxErrorMessageLength = 512;

/**
 * @brief Error object carried by ErrorResponse and rejected Jobs.
 *
 * A null data value is omitted on the wire.
 */
struct RpcError {
  int code = rpc_code::kInternalError;
  std::string message;
  Json::Value data;

  RpcError() = default;
  RpcError(int c, std::string msg, Json::Value d = Json::Value())
      : code(c), message(std::move(msg)), data(std::move(d)) {}

  Json::Value to_json() const;
};

// Cuts msg to kMaxErrorMessageLength, marking the cut with "...".
std::string truncate_error_message(std::string msg);

}  // namespace mcpws

#endif  // MCPWS_ERRORS_HPP_
