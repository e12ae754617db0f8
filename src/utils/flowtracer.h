#ifndef FLOWTRACER_H
#define FLOWTRACER_H

#include <QString>

enum class FlowChannel
{
    Lifecycle,
    Mcp,
    Tool,
    Registry,
    Net
};

class FlowTracer
{
  public:
    // Print a unified flow log (stderr) with channel and optional JSON-RPC request id.
    static void log(FlowChannel channel, const QString &message, const QString &requestId = QString());
};

#endif // FLOWTRACER_H
