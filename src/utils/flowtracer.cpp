#include "flowtracer.h"

#include "log_categories.h"

namespace
{
QString channelLabel(FlowChannel channel)
{
    switch (channel)
    {
    case FlowChannel::Lifecycle: return QStringLiteral("lifecycle");
    case FlowChannel::Mcp: return QStringLiteral("mcp");
    case FlowChannel::Tool: return QStringLiteral("tool");
    case FlowChannel::Registry: return QStringLiteral("registry");
    case FlowChannel::Net: return QStringLiteral("net");
    }
    return QStringLiteral("unknown");
}
} // namespace

void FlowTracer::log(FlowChannel channel, const QString &message, const QString &requestId)
{
    const QString channelPart = QStringLiteral("[flow][%1]").arg(channelLabel(channel));
    const QString line = requestId.isEmpty() ? QStringLiteral("%1 %2").arg(channelPart, message)
                                             : QStringLiteral("%1[req%2] %3").arg(channelPart, requestId, message);
    qCInfo(lcFlow).noquote() << line;
}
