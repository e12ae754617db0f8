#ifndef ONCHAIN_XMCP_INTERNAL_H
#define ONCHAIN_XMCP_INTERNAL_H

#include "mcp_json.h"

#include <QString>

namespace onchain::mcp
{
// JSON-RPC 2.0 response envelopes. id is copied as-is (string, number or null).
::mcp::json makeResult(const ::mcp::json &id, ::mcp::json result);
::mcp::json makeError(const ::mcp::json &id, int code, const QString &message);

// Request without an "id" member; never answered.
bool isNotification(const ::mcp::json &message);

// Returns 0 when the message is a well-formed request/notification, otherwise an
// ErrorCode with a human readable reason in errorMessage.
int validateMessage(const ::mcp::json &message, QString *errorMessage);

// id to echo back; null when the message carries no usable id.
::mcp::json responseId(const ::mcp::json &message);

// Log friendly id ("7", "abc", "null").
QString idToString(const ::mcp::json &id);
} // namespace onchain::mcp

#endif // ONCHAIN_XMCP_INTERNAL_H
