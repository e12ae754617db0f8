#include "app_bootstrap.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QSettings>

#include "cmakeconfig.h"
#include "service/explorer/chain_registry.h"
#include "utils/log_handler.h"
#include "utils/onchain_error.h"

namespace
{
// 数值配置：非法值保留上一层的取值并记录警告
void applyInt(AppContext &ctx, int *target, const QString &source, const QString &raw, int minimum)
{
    bool ok = false;
    const int value = raw.trimmed().toInt(&ok);
    if (!ok || value < minimum)
    {
        ctx.warnings << formatOnchainError(OnchainErrorCode::ConfigInvalid,
                                           QStringLiteral("%1: invalid value \"%2\", keeping %3").arg(source, raw).arg(*target));
        return;
    }
    *target = value;
}

void applyLogLevel(AppContext &ctx, const QString &source, const QString &raw)
{
    QtMsgType level = QtInfoMsg;
    if (!LogHandler::parseLevel(raw, &level))
    {
        ctx.warnings << formatOnchainError(OnchainErrorCode::ConfigInvalid,
                                           QStringLiteral("%1: unknown log level \"%2\", keeping %3").arg(source, raw, ctx.logLevel));
        return;
    }
    ctx.logLevel = raw.trimmed().toLower();
}

void applyRegistryUrl(AppContext &ctx, const QString &source, const QString &raw)
{
    const QString url = raw.trimmed();
    if (url.isEmpty())
    {
        ctx.warnings << formatOnchainError(OnchainErrorCode::ConfigInvalid, QStringLiteral("%1: empty registry url ignored").arg(source));
        return;
    }
    ctx.registryUrl = ChainRegistry::normalizeBaseUrl(url);
}
} // namespace

AppContext AppBootstrap::defaults()
{
    AppContext ctx;
    ctx.explorerOverrides = ChainRegistry::defaultExplorerOverrides();
    return ctx;
}

void AppBootstrap::applySettings(AppContext &ctx, QSettings &settings)
{
    const QString file = QFileInfo(settings.fileName()).fileName();
    auto source = [&file](const char *key) { return QStringLiteral("%1 [%2]").arg(file, QString::fromLatin1(key)); };

    if (settings.contains("registry/url")) applyRegistryUrl(ctx, source("registry/url"), settings.value("registry/url").toString());
    if (settings.contains("http/timeout_ms")) applyInt(ctx, &ctx.httpTimeoutMs, source("http/timeout_ms"), settings.value("http/timeout_ms").toString(), 1);
    if (settings.contains("http/max_retries")) applyInt(ctx, &ctx.httpMaxRetries, source("http/max_retries"), settings.value("http/max_retries").toString(), 0);
    if (settings.contains("http/retry_base_ms")) applyInt(ctx, &ctx.httpRetryBaseMs, source("http/retry_base_ms"), settings.value("http/retry_base_ms").toString(), 1);
    if (settings.contains("http/retry_max_ms")) applyInt(ctx, &ctx.httpRetryMaxMs, source("http/retry_max_ms"), settings.value("http/retry_max_ms").toString(), 1);
    if (settings.contains("server/max_concurrent_calls"))
    {
        applyInt(ctx, &ctx.maxConcurrentCalls, source("server/max_concurrent_calls"), settings.value("server/max_concurrent_calls").toString(), 1);
    }
    if (settings.contains("log/level")) applyLogLevel(ctx, source("log/level"), settings.value("log/level").toString());

    settings.beginGroup(QStringLiteral("explorers"));
    const QStringList chainKeys = settings.childKeys();
    for (const QString &key : chainKeys)
    {
        bool ok = false;
        const int chainId = key.toInt(&ok);
        const QString url = settings.value(key).toString().trimmed();
        if (!ok || url.isEmpty())
        {
            ctx.warnings << formatOnchainError(OnchainErrorCode::ConfigInvalid,
                                               QStringLiteral("%1 [explorers/%2]: invalid explorer override ignored").arg(file, key));
            continue;
        }
        ctx.explorerOverrides.insert(chainId, ChainRegistry::normalizeBaseUrl(url));
    }
    settings.endGroup();
}

void AppBootstrap::applyEnvironment(AppContext &ctx, const QProcessEnvironment &env)
{
    if (env.contains("ONCHAIN_REGISTRY_URL")) applyRegistryUrl(ctx, QStringLiteral("ONCHAIN_REGISTRY_URL"), env.value("ONCHAIN_REGISTRY_URL"));
    if (env.contains("ONCHAIN_HTTP_TIMEOUT_MS"))
    {
        applyInt(ctx, &ctx.httpTimeoutMs, QStringLiteral("ONCHAIN_HTTP_TIMEOUT_MS"), env.value("ONCHAIN_HTTP_TIMEOUT_MS"), 1);
    }
    if (env.contains("ONCHAIN_HTTP_RETRIES"))
    {
        applyInt(ctx, &ctx.httpMaxRetries, QStringLiteral("ONCHAIN_HTTP_RETRIES"), env.value("ONCHAIN_HTTP_RETRIES"), 0);
    }
    if (env.contains("ONCHAIN_MAX_CONCURRENT"))
    {
        applyInt(ctx, &ctx.maxConcurrentCalls, QStringLiteral("ONCHAIN_MAX_CONCURRENT"), env.value("ONCHAIN_MAX_CONCURRENT"), 1);
    }
    if (env.contains("ONCHAIN_LOG_LEVEL")) applyLogLevel(ctx, QStringLiteral("ONCHAIN_LOG_LEVEL"), env.value("ONCHAIN_LOG_LEVEL"));
}

AppBootstrap::Result AppBootstrap::bootstrap(const QStringList &arguments, const QProcessEnvironment &env)
{
    Result result;
    result.context = defaults();
    AppContext &ctx = result.context;

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("MCP server for on-chain data of Blockscout-indexed EVM chains (JSON-RPC over stdio)"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption(QStringList{QStringLiteral("v"), QStringLiteral("version")}, QStringLiteral("Displays version information."));
    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("INI configuration file."), QStringLiteral("file"));
    const QCommandLineOption registryOption(QStringLiteral("registry-url"), QStringLiteral("Chain registry base URL."), QStringLiteral("url"));
    const QCommandLineOption timeoutOption(QStringLiteral("timeout-ms"), QStringLiteral("HTTP request timeout in milliseconds."), QStringLiteral("ms"));
    const QCommandLineOption retriesOption(QStringLiteral("retries"), QStringLiteral("Retries for transient HTTP failures."), QStringLiteral("n"));
    const QCommandLineOption logLevelOption(QStringLiteral("log-level"), QStringLiteral("debug, info, warning or critical."), QStringLiteral("level"));
    const QCommandLineOption listToolsOption(QStringLiteral("list-tools"), QStringLiteral("Print the tool list as JSON and exit."));
    parser.addOption(versionOption);
    parser.addOption(configOption);
    parser.addOption(registryOption);
    parser.addOption(timeoutOption);
    parser.addOption(retriesOption);
    parser.addOption(logLevelOption);
    parser.addOption(listToolsOption);

    if (!parser.parse(arguments))
    {
        result.action = Result::Fail;
        result.message = formatOnchainError(OnchainErrorCode::ConfigInvalid, parser.errorText());
        return result;
    }
    if (parser.isSet(helpOption))
    {
        result.action = Result::ShowHelp;
        result.message = parser.helpText();
        return result;
    }
    if (parser.isSet(versionOption))
    {
        result.action = Result::ShowVersion;
        result.message = QStringLiteral("%1 %2").arg(QStringLiteral(ONCHAIN_SERVER_NAME), QStringLiteral(ONCHAIN_VERSION));
        return result;
    }
    if (!parser.positionalArguments().isEmpty())
    {
        result.action = Result::Fail;
        result.message = formatOnchainError(OnchainErrorCode::ConfigInvalid,
                                            QStringLiteral("unexpected argument: %1").arg(parser.positionalArguments().first()));
        return result;
    }

    if (!arguments.isEmpty()) ctx.appDir = QFileInfo(arguments.first()).absolutePath();

    // INI 路径：--config 优先于 ONCHAIN_CONFIG；显式指定但不存在视为错误
    QString configPath = parser.value(configOption);
    if (configPath.isEmpty()) configPath = env.value(QStringLiteral("ONCHAIN_CONFIG"));
    if (!configPath.isEmpty())
    {
        const QFileInfo info(configPath);
        if (!info.isFile() || !info.isReadable())
        {
            result.action = Result::Fail;
            result.message = formatOnchainError(OnchainErrorCode::ConfigInvalid, QStringLiteral("config file not found: %1").arg(configPath));
            return result;
        }
        QSettings settings(info.absoluteFilePath(), QSettings::IniFormat);
        settings.setIniCodec("utf-8");
        if (settings.status() != QSettings::NoError)
        {
            result.action = Result::Fail;
            result.message = formatOnchainError(OnchainErrorCode::ConfigInvalid, QStringLiteral("config file is malformed: %1").arg(configPath));
            return result;
        }
        applySettings(ctx, settings);
        ctx.configPath = info.absoluteFilePath();
    }

    applyEnvironment(ctx, env);

    if (parser.isSet(registryOption)) applyRegistryUrl(ctx, QStringLiteral("--registry-url"), parser.value(registryOption));
    if (parser.isSet(timeoutOption)) applyInt(ctx, &ctx.httpTimeoutMs, QStringLiteral("--timeout-ms"), parser.value(timeoutOption), 1);
    if (parser.isSet(retriesOption)) applyInt(ctx, &ctx.httpMaxRetries, QStringLiteral("--retries"), parser.value(retriesOption), 0);
    if (parser.isSet(logLevelOption))
    {
        // 命令行显式给出的非法日志级别直接报错
        QtMsgType level = QtInfoMsg;
        if (!LogHandler::parseLevel(parser.value(logLevelOption), &level))
        {
            result.action = Result::Fail;
            result.message = formatOnchainError(OnchainErrorCode::ConfigInvalid,
                                                QStringLiteral("unknown log level: %1").arg(parser.value(logLevelOption)));
            return result;
        }
        ctx.logLevel = parser.value(logLevelOption).trimmed().toLower();
    }
    ctx.listTools = parser.isSet(listToolsOption);

    if (ctx.httpRetryMaxMs < ctx.httpRetryBaseMs) ctx.httpRetryMaxMs = ctx.httpRetryBaseMs;
    return result;
}
