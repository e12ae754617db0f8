#include "service/tools/tool_args.h"

#include "utils/onchain_error.h"

#include <cstdint>
#include <limits>

namespace tool_args
{
namespace
{
const mcp::json &requireField(const mcp::json &args, const char *key)
{
    requireObject(args);
    const auto it = args.find(key);
    if (it == args.end() || it->is_null())
    {
        throw tool_argument_exception(QStringLiteral("missing required argument: %1").arg(QString::fromLatin1(key)));
    }
    return *it;
}
} // namespace

void requireObject(const mcp::json &args)
{
    if (!args.is_object()) throw tool_argument_exception(QStringLiteral("arguments must be an object"));
}

int requireChainId(const mcp::json &args, const char *key)
{
    const mcp::json &value = requireField(args, key);
    if (!value.is_number_integer())
    {
        throw tool_argument_exception(QStringLiteral("argument %1 must be an integer").arg(QString::fromLatin1(key)));
    }
    if (value.is_number_unsigned())
    {
        const auto id = value.get<std::uint64_t>();
        if (id > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
        {
            throw tool_argument_exception(QStringLiteral("argument %1 is out of range").arg(QString::fromLatin1(key)));
        }
        return static_cast<int>(id);
    }
    const auto id = value.get<std::int64_t>();
    if (id < std::numeric_limits<int>::min() || id > std::numeric_limits<int>::max())
    {
        throw tool_argument_exception(QStringLiteral("argument %1 is out of range").arg(QString::fromLatin1(key)));
    }
    return static_cast<int>(id);
}

QString requireString(const mcp::json &args, const char *key)
{
    const mcp::json &value = requireField(args, key);
    if (!value.is_string())
    {
        throw tool_argument_exception(QStringLiteral("argument %1 must be a string").arg(QString::fromLatin1(key)));
    }
    return QString::fromStdString(value.get<std::string>());
}

quint64 requireUnsigned(const mcp::json &args, const char *key)
{
    const mcp::json &value = requireField(args, key);
    if (value.is_number_unsigned()) return static_cast<quint64>(value.get<std::uint64_t>());
    // 负数与浮点数均拒绝
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0)
    {
        throw tool_argument_exception(QStringLiteral("argument %1 must be a non-negative integer").arg(QString::fromLatin1(key)));
    }
    return static_cast<quint64>(value.get<std::int64_t>());
}
} // namespace tool_args
