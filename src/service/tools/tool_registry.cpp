#include "service/tools/tool_registry.h"

#include "utils/onchain_error.h"

bool ToolRegistry::add(Entry entry)
{
    if (entry.name.isEmpty() || !entry.handler) return false;
    if (find(entry.name)) return false;
    entries_.push_back(std::move(entry));
    return true;
}

const ToolRegistry::Entry *ToolRegistry::find(const QString &name) const
{
    for (const auto &entry : entries_)
    {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}

mcp::json ToolRegistry::listTools() const
{
    mcp::json tools = mcp::json::array();
    for (const auto &entry : entries_)
    {
        mcp::json tool;
        tool["name"] = entry.name.toStdString();
        tool["description"] = entry.description.toStdString();
        tool["inputSchema"] = entry.inputSchema;
        tools.push_back(std::move(tool));
    }
    mcp::json result;
    result["tools"] = std::move(tools);
    return result;
}

mcp::json ToolRegistry::call(const QString &name, const mcp::json &arguments) const
{
    const Entry *entry = find(name);
    if (!entry)
    {
        throw tool_argument_exception(QStringLiteral("tool not found: %1").arg(name), OnchainErrorCode::ToolUnknown);
    }
    return textResult(entry->handler(arguments));
}

mcp::json ToolRegistry::textResult(const mcp::json &payload)
{
    mcp::json content;
    content["type"] = "text";
    content["text"] = payload.dump(2, ' ', false, mcp::json::error_handler_t::replace);
    mcp::json result;
    result["content"] = mcp::json::array({content});
    result["isError"] = false;
    return result;
}
