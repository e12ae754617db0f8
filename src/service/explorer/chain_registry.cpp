#include "service/explorer/chain_registry.h"

#include "service/net/http_fetcher.h"
#include "utils/flowtracer.h"
#include "utils/log_categories.h"
#include "utils/onchain_error.h"
#include "xconfig.h"

#include <QReadLocker>
#include <QUrl>
#include <QWriteLocker>

QString Chain::explorerUrl() const
{
    if (!explorers.isEmpty()) return explorers.first().url;
    throw explorer_exception(OnchainErrorCode::RegistryNoExplorers, QStringLiteral("no explorers"));
}

Chain Chain::fromJson(const mcp::json &object)
{
    if (!object.is_object())
    {
        throw explorer_exception(OnchainErrorCode::RegistryLookupFailed, QStringLiteral("invalid chain registry response"));
    }
    Chain chain;
    chain.name = QString::fromStdString(get_string_safely(object, "name"));
    chain.description = QString::fromStdString(get_string_safely(object, "description"));
    const auto testnetIt = object.find("isTestnet");
    chain.isTestnet = (testnetIt != object.end() && testnetIt->is_boolean()) ? testnetIt->get<bool>() : false;

    const auto explorersIt = object.find("explorers");
    if (explorersIt != object.end() && explorersIt->is_array())
    {
        for (const auto &entry : *explorersIt)
        {
            const QString url = QString::fromStdString(get_string_safely(entry, "url"));
            if (url.isEmpty()) continue;
            chain.explorers.push_back(ChainExplorer{url});
        }
    }
    return chain;
}

ChainRegistry::ChainRegistry(IHttpFetcher &fetcher, QString registryUrl, QHash<int, QString> explorerOverrides)
    : fetcher_(fetcher), registryUrl_(normalizeBaseUrl(std::move(registryUrl)))
{
    for (auto it = explorerOverrides.constBegin(); it != explorerOverrides.constEnd(); ++it)
    {
        if (it.value().trimmed().isEmpty()) continue;
        overrides_.insert(it.key(), normalizeBaseUrl(it.value()));
    }
}

QHash<int, QString> ChainRegistry::defaultExplorerOverrides()
{
    QHash<int, QString> overrides;
    overrides.insert(MERLIN_CHAIN_ID, QStringLiteral(MERLIN_EXPLORER_URL));
    return overrides;
}

QString ChainRegistry::normalizeBaseUrl(QString url)
{
    url = url.trimmed();
    if (!url.isEmpty() && !url.endsWith(QLatin1Char('/'))) url.append(QLatin1Char('/'));
    return url;
}

Chain ChainRegistry::getChain(int chainId)
{
    {
        QReadLocker readLocker(&lock_);
        const auto it = cache_.constFind(chainId);
        if (it != cache_.constEnd()) return it.value();
    }

    QWriteLocker writeLocker(&lock_);
    // 等待写锁期间其他线程可能已完成同一条链的查询
    const auto it = cache_.constFind(chainId);
    if (it != cache_.constEnd()) return it.value();

    Chain chain = fetchChain(chainId);
    cache_.insert(chainId, chain);
    FlowTracer::log(FlowChannel::Registry,
                    QStringLiteral("registry:cached chain=%1 name=%2 explorers=%3")
                        .arg(chainId)
                        .arg(chain.name)
                        .arg(chain.explorers.size()));
    return chain;
}

QString ChainRegistry::explorerUrl(int chainId)
{
    const auto overrideIt = overrides_.constFind(chainId);
    if (overrideIt != overrides_.constEnd()) return overrideIt.value();
    return normalizeBaseUrl(getChain(chainId).explorerUrl());
}

int ChainRegistry::cachedChainCount() const
{
    QReadLocker locker(&lock_);
    return cache_.size();
}

void ChainRegistry::clear()
{
    QWriteLocker locker(&lock_);
    cache_.clear();
}

Chain ChainRegistry::fetchChain(int chainId) const
{
    const QUrl url(registryUrl_ + QString::number(chainId));
    const HttpResponse response = fetcher_.get(url);
    if (!response.isOk())
    {
        const OnchainErrorCode code = response.timedOut ? OnchainErrorCode::NetTimeout : OnchainErrorCode::RegistryLookupFailed;
        const QString message = QStringLiteral("request failed: %1").arg(response.statusText());
        qCWarning(lcExplorer).noquote() << formatOnchainError(code, QStringLiteral("chain %1 lookup: %2").arg(chainId).arg(message));
        throw explorer_exception(code, message);
    }

    mcp::json payload;
    try
    {
        payload = mcp::json::parse(response.body.constData(), response.body.constData() + response.body.size());
    }
    catch (const mcp::json::exception &e)
    {
        throw explorer_exception(OnchainErrorCode::ApiInvalidJson,
                                 QStringLiteral("invalid chain registry response: %1").arg(QString::fromUtf8(e.what())));
    }
    return Chain::fromJson(payload);
}
