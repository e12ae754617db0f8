// xmcp.cpp
#include "xmcp.h"
#include "xmcp_internal.h"

#include "service/tools/tool_registry.h"
#include "utils/flowtracer.h"
#include "utils/log_categories.h"
#include "utils/onchain_error.h"

#include <QElapsedTimer>
#include <QMetaObject>
#include <QtConcurrent/QtConcurrentRun>
#include <utility>

using onchain::mcp::idToString;
using onchain::mcp::isNotification;
using onchain::mcp::makeError;
using onchain::mcp::makeResult;
using onchain::mcp::responseId;
using onchain::mcp::validateMessage;

namespace
{
// 未注入 controller 时使用：没有任何工具
class EmptyToolController : public IMcpToolController
{
  public:
    mcp::json listTools() const override { return mcp::json{{"tools", mcp::json::array()}}; }
    mcp::json callTool(const QString &toolName, const mcp::json &) override
    {
        throw tool_argument_exception(QStringLiteral("tool not found: %1").arg(toolName), OnchainErrorCode::ToolUnknown);
    }
};

xMcpOptions normalizeOptions(xMcpOptions opts)
{
    if (opts.maxConcurrentCalls <= 0) opts.maxConcurrentCalls = DEFAULT_MAX_CONCURRENT_CALLS;
    if (opts.serverName.isEmpty()) opts.serverName = QStringLiteral(ONCHAIN_SERVER_NAME);
    return opts;
}
} // namespace

RegistryToolController::RegistryToolController(const ToolRegistry &registry)
    : registry_(registry)
{
}

mcp::json RegistryToolController::listTools() const
{
    return registry_.listTools();
}

mcp::json RegistryToolController::callTool(const QString &toolName, const mcp::json &arguments)
{
    return registry_.call(toolName, arguments);
}

xMcp::xMcp(QObject *parent, std::unique_ptr<IMcpToolController> controller, xMcpOptions options)
    : QObject(parent), options_(normalizeOptions(std::move(options)))
{
    controller_ = controller ? std::move(controller) : std::make_unique<EmptyToolController>();
    pool_.setMaxThreadCount(options_.maxConcurrentCalls);
    qCDebug(lcMcp) << "mcp init over, max concurrent calls" << options_.maxConcurrentCalls;
}

xMcp::~xMcp()
{
    // 工作线程持有 this，析构前必须全部结束
    pool_.waitForDone();
}

QByteArray xMcp::serialize(const mcp::json &message)
{
    return QByteArray::fromStdString(message.dump(-1, ' ', false, mcp::json::error_handler_t::replace));
}

void xMcp::handleLine(const QByteArray &line)
{
    const QByteArray trimmed = line.trimmed();
    if (trimmed.isEmpty()) return;
    if (closing_)
    {
        qCWarning(lcMcp) << "message received after input closed, ignored";
        return;
    }

    mcp::json message;
    try
    {
        message = mcp::json::parse(trimmed.constData(), trimmed.constData() + trimmed.size());
    }
    catch (const mcp::json::parse_error &e)
    {
        qCWarning(lcMcp) << "parse error:" << e.what();
        emit responseReady(serialize(makeError(nullptr, mcp::PARSE_ERROR, QStringLiteral("Parse error: %1").arg(QString::fromUtf8(e.what())))));
        return;
    }

    const mcp::json response = handleMessage(message);
    if (!response.is_null()) emit responseReady(serialize(response));
}

mcp::json xMcp::handleMessage(const mcp::json &message)
{
    if (message.is_array())
    {
        // 不支持批量请求
        return makeError(nullptr, mcp::INVALID_REQUEST, QStringLiteral("Invalid Request: batch requests are not supported"));
    }

    QString invalidReason;
    const int invalid = validateMessage(message, &invalidReason);
    if (invalid != 0)
    {
        qCWarning(lcMcp).noquote() << invalidReason;
        return makeError(responseId(message), invalid, invalidReason);
    }

    const std::string method = message["method"].get<std::string>();
    const mcp::json params = message.contains("params") && message["params"].is_object() ? message["params"] : mcp::json::object();

    if (isNotification(message))
    {
        if (method == "notifications/initialized")
        {
            initialized_ = true;
            FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("client initialized"));
        }
        else
        {
            qCDebug(lcMcp) << "notification ignored:" << QString::fromStdString(method);
        }
        return nullptr;
    }

    const mcp::json id = message["id"];
    FlowTracer::log(FlowChannel::Mcp, QStringLiteral("-> %1").arg(QString::fromStdString(method)), idToString(id));

    if (method == "initialize") return handleInitialize(id, params);
    if (method == "ping") return makeResult(id, mcp::json::object());
    if (method == "tools/list") return makeResult(id, controller_->listTools());
    if (method == "tools/call") return startToolCall(id, params);

    return makeError(id, mcp::METHOD_NOT_FOUND, QStringLiteral("Method not found: %1").arg(QString::fromStdString(method)));
}

mcp::json xMcp::handleInitialize(const mcp::json &id, const mcp::json &params)
{
    const mcp::json clientInfo = get_json_object_safely(params, "clientInfo");
    FlowTracer::log(FlowChannel::Lifecycle,
                    QStringLiteral("initialize client=%1 %2 protocol=%3")
                        .arg(QString::fromStdString(get_string_safely(clientInfo, "name", "unknown")),
                             QString::fromStdString(get_string_safely(clientInfo, "version")),
                             QString::fromStdString(get_string_safely(params, "protocolVersion"))),
                    idToString(id));

    mcp::json serverInfo;
    serverInfo["name"] = options_.serverName.toStdString();
    serverInfo["version"] = options_.serverVersion.toStdString();

    mcp::json result;
    result["protocolVersion"] = mcp::MCP_VERSION;
    result["capabilities"] = mcp::json{{"tools", mcp::json::object()}};
    result["serverInfo"] = std::move(serverInfo);
    if (!options_.instructions.isEmpty()) result["instructions"] = options_.instructions.toStdString();
    initialized_ = true;
    return makeResult(id, std::move(result));
}

mcp::json xMcp::startToolCall(const mcp::json &id, const mcp::json &params)
{
    const auto nameIt = params.find("name");
    if (nameIt == params.end() || !nameIt->is_string())
    {
        return makeError(id, mcp::INVALID_PARAMS, QStringLiteral("Invalid params: missing tool name"));
    }
    mcp::json arguments = mcp::json::object();
    const auto argsIt = params.find("arguments");
    if (argsIt != params.end() && !argsIt->is_null())
    {
        if (!argsIt->is_object())
        {
            return makeError(id, mcp::INVALID_PARAMS, QStringLiteral("Invalid params: arguments must be an object"));
        }
        arguments = *argsIt;
    }

    const QString toolName = QString::fromStdString(nameIt->get<std::string>());
    ++inFlight_;
    QtConcurrent::run(&pool_, [this, id, toolName, arguments]()
                      {
                          const QByteArray line = serialize(executeToolCall(id, toolName, arguments));
                          QMetaObject::invokeMethod(this, [this, line]()
                                                    { finishToolCall(line); }, Qt::QueuedConnection);
                      });
    return nullptr;
}

// 在工作线程中执行
mcp::json xMcp::executeToolCall(const mcp::json &id, const QString &toolName, const mcp::json &arguments)
{
    const QString requestId = idToString(id);
    QElapsedTimer timer;
    timer.start();
    try
    {
        mcp::json result = controller_->callTool(toolName, arguments);
        FlowTracer::log(FlowChannel::Tool, QStringLiteral("%1 ok (%2 ms)").arg(toolName).arg(timer.elapsed()), requestId);
        return makeResult(id, std::move(result));
    }
    catch (const tool_argument_exception &e)
    {
        const QString message = QString::fromStdString(e.what());
        qCWarning(lcMcp).noquote() << formatOnchainError(e.code(), QStringLiteral("%1: %2").arg(toolName, message));
        return makeError(id, mcp::INVALID_PARAMS, message);
    }
    catch (const explorer_exception &e)
    {
        const QString message = QString::fromStdString(e.what());
        FlowTracer::log(FlowChannel::Tool, QStringLiteral("%1 failed (%2 ms): %3").arg(toolName).arg(timer.elapsed()).arg(message), requestId);
        return makeError(id, mcp::INTERNAL_ERROR, message);
    }
    catch (const std::exception &e)
    {
        const QString message = QString::fromStdString(e.what());
        qCCritical(lcMcp).noquote() << "tool" << toolName << "raised:" << message;
        return makeError(id, mcp::INTERNAL_ERROR, message);
    }
}

void xMcp::finishToolCall(const QByteArray &line)
{
    emit responseReady(line);
    --inFlight_;
    maybeDrained();
}

void xMcp::inputClosed()
{
    if (closing_) return;
    closing_ = true;
    FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("input closed, %1 call(s) in flight").arg(inFlight_));
    maybeDrained();
}

void xMcp::maybeDrained()
{
    if (!closing_ || inFlight_ > 0 || drainedEmitted_) return;
    drainedEmitted_ = true;
    emit drained();
}
