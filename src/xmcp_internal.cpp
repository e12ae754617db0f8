#include "xmcp_internal.h"

namespace onchain::mcp
{
namespace
{
bool isValidId(const ::mcp::json &id)
{
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned() || id.is_null();
}
} // namespace

::mcp::json makeResult(const ::mcp::json &id, ::mcp::json result)
{
    ::mcp::json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = id;
    response["result"] = std::move(result);
    return response;
}

::mcp::json makeError(const ::mcp::json &id, int code, const QString &message)
{
    ::mcp::json error;
    error["code"] = code;
    error["message"] = message.toStdString();
    ::mcp::json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = id;
    response["error"] = std::move(error);
    return response;
}

bool isNotification(const ::mcp::json &message)
{
    return message.is_object() && !message.contains("id");
}

int validateMessage(const ::mcp::json &message, QString *errorMessage)
{
    auto fail = [errorMessage](const QString &reason)
    {
        if (errorMessage) *errorMessage = reason;
        return static_cast<int>(::mcp::ErrorCode::INVALID_REQUEST);
    };

    if (!message.is_object()) return fail(QStringLiteral("Invalid Request: expected a JSON object"));
    const auto versionIt = message.find("jsonrpc");
    if (versionIt == message.end() || !versionIt->is_string() || versionIt->get<std::string>() != JSONRPC_VERSION)
    {
        return fail(QStringLiteral("Invalid Request: jsonrpc must be \"2.0\""));
    }
    const auto methodIt = message.find("method");
    if (methodIt == message.end() || !methodIt->is_string() || methodIt->get<std::string>().empty())
    {
        return fail(QStringLiteral("Invalid Request: missing method"));
    }
    const auto idIt = message.find("id");
    if (idIt != message.end() && !isValidId(*idIt)) return fail(QStringLiteral("Invalid Request: invalid id"));
    const auto paramsIt = message.find("params");
    if (paramsIt != message.end() && !paramsIt->is_object() && !paramsIt->is_array() && !paramsIt->is_null())
    {
        return fail(QStringLiteral("Invalid Request: params must be an object or array"));
    }
    return 0;
}

::mcp::json responseId(const ::mcp::json &message)
{
    if (!message.is_object()) return nullptr;
    const auto idIt = message.find("id");
    if (idIt == message.end() || !isValidId(*idIt)) return nullptr;
    return *idIt;
}

QString idToString(const ::mcp::json &id)
{
    if (id.is_string()) return QString::fromStdString(id.get<std::string>());
    return QString::fromStdString(id.dump());
}
} // namespace onchain::mcp
