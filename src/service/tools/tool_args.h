#ifndef TOOL_ARGS_H
#define TOOL_ARGS_H

#include "mcp_json.h"

#include <QString>
#include <QtGlobal>

// tools/call 参数读取；缺失或类型不符时抛出 tool_argument_exception
namespace tool_args
{
void requireObject(const mcp::json &args);
int requireChainId(const mcp::json &args, const char *key = "chain_id");
QString requireString(const mcp::json &args, const char *key);
quint64 requireUnsigned(const mcp::json &args, const char *key);
} // namespace tool_args

#endif // TOOL_ARGS_H
