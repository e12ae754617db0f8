#include "cmakeconfig.h"

#include <QCoreApplication>
#include <QProcessEnvironment>
#include <QTimer>

#include <csignal>
#include <cstdio>
#include <memory>
#include <unistd.h>

#include "app/app_bootstrap.h"
#include "service/explorer/explorer_api.h"
#include "service/net/http_fetcher.h"
#include "service/tools/onchain_tools.h"
#include "service/transport/stdio_transport.h"
#include "utils/flowtracer.h"
#include "utils/log_categories.h"
#include "utils/log_handler.h"
#include "utils/startuplogger.h"
#include "xconfig.h"
#include "xmcp.h"

namespace
{
volatile std::sig_atomic_t g_stopSignal = 0;

void handleStopSignal(int signum)
{
    g_stopSignal = signum;
}

void writeTo(std::FILE *stream, const QByteArray &text)
{
    std::fwrite(text.constData(), 1, static_cast<size_t>(text.size()), stream);
    if (!text.endsWith('\n')) std::fputc('\n', stream);
    std::fflush(stream);
}
} // namespace

int main(int argc, char *argv[])
{
    StartupLogger::start();
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral(ONCHAIN_SERVER_NAME));
    QCoreApplication::setApplicationVersion(QStringLiteral(ONCHAIN_VERSION));

    const AppBootstrap::Result boot = AppBootstrap::bootstrap(app.arguments(), QProcessEnvironment::systemEnvironment());
    switch (boot.action)
    {
    case AppBootstrap::Result::ShowHelp:
    case AppBootstrap::Result::ShowVersion:
        writeTo(stdout, boot.message.toUtf8());
        return ONCHAIN_EXIT_OK;
    case AppBootstrap::Result::Fail:
        writeTo(stderr, boot.message.toUtf8());
        return ONCHAIN_EXIT_CONFIG;
    case AppBootstrap::Result::Run:
    default:
        break;
    }
    const AppContext &ctx = boot.context;

    QtMsgType minLevel = QtInfoMsg;
    LogHandler::parseLevel(ctx.logLevel, &minLevel);
    LogHandler::install(minLevel);
    for (const QString &warning : ctx.warnings)
    {
        qCWarning(lcApp).noquote() << warning;
    }
    if (!ctx.configPath.isEmpty()) qCInfo(lcApp).noquote() << "config loaded from" << ctx.configPath;
    StartupLogger::log(QStringLiteral("config ready"));

    HttpFetcherOptions fetcherOptions;
    fetcherOptions.timeoutMs = ctx.httpTimeoutMs;
    fetcherOptions.retry.maxRetries = ctx.httpMaxRetries;
    fetcherOptions.retry.baseDelayMs = ctx.httpRetryBaseMs;
    fetcherOptions.retry.maxDelayMs = ctx.httpRetryMaxMs;
    fetcherOptions.userAgent = QByteArrayLiteral(ONCHAIN_USER_AGENT);

    ExplorerApi api(std::make_unique<QtHttpFetcher>(fetcherOptions), ctx.registryUrl, ctx.explorerOverrides);
    const ToolRegistry registry = OnchainTools::build(api);
    StartupLogger::log(QStringLiteral("tools registered: %1").arg(registry.size()));

    if (ctx.listTools)
    {
        writeTo(stdout, QByteArray::fromStdString(registry.listTools().dump(2)));
        return ONCHAIN_EXIT_OK;
    }

    xMcpOptions mcpOptions;
    mcpOptions.maxConcurrentCalls = ctx.maxConcurrentCalls;
    xMcp server(nullptr, std::make_unique<RegistryToolController>(registry), mcpOptions);
    StdioTransport transport(STDIN_FILENO, STDOUT_FILENO);

    QObject::connect(&transport, &StdioTransport::lineReceived, &server, &xMcp::handleLine);
    QObject::connect(&transport, &StdioTransport::inputClosed, &server, &xMcp::inputClosed);
    QObject::connect(&server, &xMcp::responseReady, &transport, &StdioTransport::send);
    QObject::connect(&server, &xMcp::drained, &app, &QCoreApplication::quit, Qt::QueuedConnection);

    // stdout 被关闭时写失败返回错误，而不是让进程被 SIGPIPE 终止
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);
    QTimer signalPoll;
    signalPoll.setInterval(200);
    QObject::connect(&signalPoll, &QTimer::timeout, &app, [&app, &api]()
                     {
                         if (g_stopSignal == 0) return;
                         qCInfo(lcApp) << "signal" << int(g_stopSignal) << "received, shutting down";
                         // 在途的 tools/call 被中止后 xMcp 析构时的 waitForDone 才能及时返回
                         api.cancelPendingRequests();
                         app.quit();
                     });
    signalPoll.start();

    transport.start();
    FlowTracer::log(FlowChannel::Lifecycle,
                    QStringLiteral("%1 %2 serving on stdio, registry %3").arg(QStringLiteral(ONCHAIN_SERVER_NAME), QStringLiteral(ONCHAIN_VERSION), ctx.registryUrl));
    StartupLogger::log(QStringLiteral("serving"));

    const int rc = app.exec();
    FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("event loop finished (%1)").arg(rc));
    return rc == 0 ? ONCHAIN_EXIT_OK : ONCHAIN_EXIT_RUNTIME;
}
