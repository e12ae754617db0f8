#include "service/explorer/explorer_api.h"

#include "utils/flowtracer.h"
#include "utils/log_categories.h"
#include "utils/onchain_error.h"
#include "xconfig.h"

ExplorerApi::ExplorerApi(std::unique_ptr<IHttpFetcher> fetcher, QString registryUrl, QHash<int, QString> explorerOverrides)
    : fetcher_(std::move(fetcher)), registry_(*fetcher_, std::move(registryUrl), std::move(explorerOverrides))
{
}

void ExplorerApi::cancelPendingRequests()
{
    fetcher_->cancel();
}

QString ExplorerApi::segment(const QString &value)
{
    // "." 与 ".." 属于非保留字符，编码后仍会在请求时被 QUrl 归一化掉，只能直接拒绝
    if (value.isEmpty() || value == QLatin1String(".") || value == QLatin1String(".."))
    {
        throw tool_argument_exception(QStringLiteral("invalid path segment: \"%1\"").arg(value));
    }
    return QString::fromLatin1(QUrl::toPercentEncoding(value));
}

QUrl ExplorerApi::buildUrl(const QString &baseUrl, const QString &path, const QUrlQuery &query)
{
    QUrl url(ChainRegistry::normalizeBaseUrl(baseUrl) + QStringLiteral(EXPLORER_API_PREFIX) + path);
    if (!query.isEmpty()) url.setQuery(query);
    return url;
}

mcp::json ExplorerApi::request(int chainId, const QString &path, const QUrlQuery &query)
{
    const QString base = registry_.explorerUrl(chainId);
    const QUrl url = buildUrl(base, path, query);
    FlowTracer::log(FlowChannel::Net, QStringLiteral("GET chain=%1 %2").arg(chainId).arg(url.toString(QUrl::FullyEncoded)));

    const HttpResponse response = fetcher_->get(url);
    if (!response.isOk())
    {
        const OnchainErrorCode code = response.timedOut ? OnchainErrorCode::NetTimeout : OnchainErrorCode::NetRequestFailed;
        const QString message = QStringLiteral("request failed: %1").arg(response.statusText());
        qCWarning(lcExplorer).noquote() << formatOnchainError(code, QStringLiteral("%1 (attempts=%2): %3")
                                                                        .arg(url.toString(QUrl::RemoveQuery))
                                                                        .arg(response.attempts)
                                                                        .arg(message));
        throw explorer_exception(code, message);
    }

    try
    {
        return mcp::json::parse(response.body.constData(), response.body.constData() + response.body.size());
    }
    catch (const mcp::json::exception &e)
    {
        const QString message = QStringLiteral("invalid JSON response: %1").arg(QString::fromUtf8(e.what()));
        qCWarning(lcExplorer).noquote() << formatOnchainError(OnchainErrorCode::ApiInvalidJson, message);
        throw explorer_exception(OnchainErrorCode::ApiInvalidJson, message);
    }
}

//-------------------------------------------------------------------------
// 链级列表
//-------------------------------------------------------------------------

mcp::json ExplorerApi::search(int chainId, const SearchParams &params)
{
    return request(chainId, QStringLiteral("search"), params.toQuery());
}

mcp::json ExplorerApi::getTransactions(int chainId, const GetTransactionsParams &params)
{
    return request(chainId, QStringLiteral("transactions"), params.toQuery());
}

mcp::json ExplorerApi::getBlocks(int chainId, const GetBlocksParams &params)
{
    return request(chainId, QStringLiteral("blocks"), params.toQuery());
}

mcp::json ExplorerApi::getTransfers(int chainId)
{
    return request(chainId, QStringLiteral("token-transfers"));
}

mcp::json ExplorerApi::getInternalTransactions(int chainId)
{
    return request(chainId, QStringLiteral("internal-transactions"));
}

mcp::json ExplorerApi::getWithdrawals(int chainId)
{
    return request(chainId, QStringLiteral("withdrawals"));
}

mcp::json ExplorerApi::getStats(int chainId)
{
    return request(chainId, QStringLiteral("stats"));
}

//-------------------------------------------------------------------------
// 交易
//-------------------------------------------------------------------------

mcp::json ExplorerApi::getTransactionInfo(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("transactions/%1").arg(segment(hash)));
}

mcp::json ExplorerApi::getTransactionTokenTransfers(int chainId, const QString &hash, const GetTransactionTokenTransfersParams &params)
{
    return request(chainId, QStringLiteral("transactions/%1/token-transfers").arg(segment(hash)), params.toQuery());
}

mcp::json ExplorerApi::getTransactionInternalTransactions(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("transactions/%1/internal-transactions").arg(segment(hash)));
}

mcp::json ExplorerApi::getTransactionLogs(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("transactions/%1/logs").arg(segment(hash)));
}

mcp::json ExplorerApi::getTransactionSummary(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("transactions/%1/summary").arg(segment(hash)));
}

//-------------------------------------------------------------------------
// 区块
//-------------------------------------------------------------------------

mcp::json ExplorerApi::getBlockInfo(int chainId, const QString &numberOrHash)
{
    return request(chainId, QStringLiteral("blocks/%1").arg(segment(numberOrHash)));
}

mcp::json ExplorerApi::getBlockTransactions(int chainId, const QString &numberOrHash)
{
    return request(chainId, QStringLiteral("blocks/%1/transactions").arg(segment(numberOrHash)));
}

mcp::json ExplorerApi::getBlockWithdrawals(int chainId, const QString &numberOrHash)
{
    return request(chainId, QStringLiteral("blocks/%1/withdrawals").arg(segment(numberOrHash)));
}

//-------------------------------------------------------------------------
// 地址
//-------------------------------------------------------------------------

mcp::json ExplorerApi::getAddresses(int chainId)
{
    return request(chainId, QStringLiteral("addresses"));
}

mcp::json ExplorerApi::getAddressInfo(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("addresses/%1").arg(segment(hash)));
}

mcp::json ExplorerApi::getAddressCounters(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("addresses/%1/counters").arg(segment(hash)));
}

mcp::json ExplorerApi::getAddressTransactions(int chainId, const QString &hash, const GetAddressTransactionsParams &params)
{
    return request(chainId, QStringLiteral("addresses/%1/transactions").arg(segment(hash)), params.toQuery());
}

mcp::json ExplorerApi::getAddressTokenTransfers(int chainId, const QString &hash, const GetAddressTokenTransfersParams &params)
{
    return request(chainId, QStringLiteral("addresses/%1/token-transfers").arg(segment(hash)), params.toQuery());
}

mcp::json ExplorerApi::getAddressInternalTransactions(int chainId, const QString &hash, const GetAddressInternalTransactionsParams &params)
{
    return request(chainId, QStringLiteral("addresses/%1/internal-transactions").arg(segment(hash)), params.toQuery());
}

mcp::json ExplorerApi::getAddressLogs(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("addresses/%1/logs").arg(segment(hash)));
}

mcp::json ExplorerApi::getAddressTokens(int chainId, const QString &hash, const GetAddressTokensParams &params)
{
    return request(chainId, QStringLiteral("addresses/%1/tokens").arg(segment(hash)), params.toQuery());
}

mcp::json ExplorerApi::getAddressCoinBalanceHistory(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("addresses/%1/coin-balance-history").arg(segment(hash)));
}

mcp::json ExplorerApi::getAddressCoinBalanceHistoryByDay(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("addresses/%1/coin-balance-history-by-day").arg(segment(hash)));
}

mcp::json ExplorerApi::getAddressWithdrawals(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("addresses/%1/withdrawals").arg(segment(hash)));
}

mcp::json ExplorerApi::getAddressNfts(int chainId, const QString &hash, const GetAddressNftsParams &params)
{
    return request(chainId, QStringLiteral("addresses/%1/nft").arg(segment(hash)), params.toQuery());
}

mcp::json ExplorerApi::getAddressNftCollections(int chainId, const QString &hash, const GetAddressNftsParams &params)
{
    return request(chainId, QStringLiteral("addresses/%1/nft/collections").arg(segment(hash)), params.toQuery());
}

//-------------------------------------------------------------------------
// 代币与 NFT 实例
//-------------------------------------------------------------------------

mcp::json ExplorerApi::getTokens(int chainId, const GetTokensParams &params)
{
    return request(chainId, QStringLiteral("tokens"), params.toQuery());
}

mcp::json ExplorerApi::getTokenInfo(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("tokens/%1").arg(segment(hash)));
}

mcp::json ExplorerApi::getTokenTransfers(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("tokens/%1/transfers").arg(segment(hash)));
}

mcp::json ExplorerApi::getTokenHolders(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("tokens/%1/holders").arg(segment(hash)));
}

mcp::json ExplorerApi::getTokenCounters(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("tokens/%1/counters").arg(segment(hash)));
}

mcp::json ExplorerApi::getTokenInstances(int chainId, const QString &hash)
{
    return request(chainId, QStringLiteral("tokens/%1/instances").arg(segment(hash)));
}

mcp::json ExplorerApi::getTokenInstanceInfo(int chainId, const QString &hash, quint64 tokenId)
{
    return request(chainId, QStringLiteral("tokens/%1/instances/%2").arg(segment(hash), QString::number(tokenId)));
}

mcp::json ExplorerApi::getTokenInstanceTransfers(int chainId, const QString &hash, quint64 tokenId)
{
    return request(chainId, QStringLiteral("tokens/%1/instances/%2/transfers").arg(segment(hash), QString::number(tokenId)));
}

mcp::json ExplorerApi::getTokenInstanceHolders(int chainId, const QString &hash, quint64 tokenId)
{
    return request(chainId, QStringLiteral("tokens/%1/instances/%2/holders").arg(segment(hash), QString::number(tokenId)));
}

mcp::json ExplorerApi::getTokenInstanceTransfersCount(int chainId, const QString &hash, quint64 tokenId)
{
    return request(chainId, QStringLiteral("tokens/%1/instances/%2/transfers-count").arg(segment(hash), QString::number(tokenId)));
}
