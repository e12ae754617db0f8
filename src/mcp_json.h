#ifndef MCP_JSON_H
#define MCP_JSON_H

#include <nlohmann/json.hpp>

namespace mcp
{
// ordered_json 保持上游 explorer 返回的字段顺序
using json = nlohmann::ordered_json;

inline constexpr const char *MCP_VERSION = "2024-11-05";
inline constexpr const char *JSONRPC_VERSION = "2.0";

// JSON-RPC 2.0 reserved error codes
enum ErrorCode
{
    PARSE_ERROR = -32700,
    INVALID_REQUEST = -32600,
    METHOD_NOT_FOUND = -32601,
    INVALID_PARAMS = -32602,
    INTERNAL_ERROR = -32603,
};
} // namespace mcp

#endif // MCP_JSON_H
