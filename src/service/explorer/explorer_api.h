#pragma once

#include <memory>

#include <QString>
#include <QUrl>
#include <QUrlQuery>

#include "mcp_json.h"
#include "service/explorer/chain_registry.h"
#include "service/explorer/explorer_params.h"
#include "service/net/http_fetcher.h"

// Blockscout explorer REST 接口（{explorer}api/v2/...）
// 所有方法在调用线程内同步执行，失败抛出 explorer_exception
class ExplorerApi
{
  public:
    ExplorerApi(std::unique_ptr<IHttpFetcher> fetcher, QString registryUrl,
                QHash<int, QString> explorerOverrides = ChainRegistry::defaultExplorerOverrides());

    ChainRegistry &registry() { return registry_; }

    // 退出时中止在途请求，此后的请求直接失败
    void cancelPendingRequests();

    // GET {base}api/v2/{path}?{query}，要求 200 且响应体为 JSON
    mcp::json request(int chainId, const QString &path, const QUrlQuery &query = QUrlQuery());

    static QUrl buildUrl(const QString &baseUrl, const QString &path, const QUrlQuery &query = QUrlQuery());
    // 调用方传入的路径片段（哈希、块号）按单段编码，不能跨越 '/'；空串、"." 与 ".." 抛出 tool_argument_exception
    static QString segment(const QString &value);

    mcp::json search(int chainId, const SearchParams &params);
    mcp::json getTransactions(int chainId, const GetTransactionsParams &params = {});
    mcp::json getBlocks(int chainId, const GetBlocksParams &params = {});
    mcp::json getTransfers(int chainId);
    mcp::json getInternalTransactions(int chainId);
    mcp::json getWithdrawals(int chainId);
    mcp::json getStats(int chainId);

    mcp::json getTransactionInfo(int chainId, const QString &hash);
    mcp::json getTransactionTokenTransfers(int chainId, const QString &hash, const GetTransactionTokenTransfersParams &params = {});
    mcp::json getTransactionInternalTransactions(int chainId, const QString &hash);
    mcp::json getTransactionLogs(int chainId, const QString &hash);
    mcp::json getTransactionSummary(int chainId, const QString &hash);

    mcp::json getBlockInfo(int chainId, const QString &numberOrHash);
    mcp::json getBlockTransactions(int chainId, const QString &numberOrHash);
    mcp::json getBlockWithdrawals(int chainId, const QString &numberOrHash);

    mcp::json getAddresses(int chainId);
    mcp::json getAddressInfo(int chainId, const QString &hash);
    mcp::json getAddressCounters(int chainId, const QString &hash);
    mcp::json getAddressTransactions(int chainId, const QString &hash, const GetAddressTransactionsParams &params = {});
    mcp::json getAddressTokenTransfers(int chainId, const QString &hash, const GetAddressTokenTransfersParams &params = {});
    mcp::json getAddressInternalTransactions(int chainId, const QString &hash, const GetAddressInternalTransactionsParams &params = {});
    mcp::json getAddressLogs(int chainId, const QString &hash);
    mcp::json getAddressTokens(int chainId, const QString &hash, const GetAddressTokensParams &params = {});
    mcp::json getAddressCoinBalanceHistory(int chainId, const QString &hash);
    mcp::json getAddressCoinBalanceHistoryByDay(int chainId, const QString &hash);
    mcp::json getAddressWithdrawals(int chainId, const QString &hash);
    mcp::json getAddressNfts(int chainId, const QString &hash, const GetAddressNftsParams &params = {});
    mcp::json getAddressNftCollections(int chainId, const QString &hash, const GetAddressNftsParams &params = {});

    mcp::json getTokens(int chainId, const GetTokensParams &params = {});
    mcp::json getTokenInfo(int chainId, const QString &hash);
    mcp::json getTokenTransfers(int chainId, const QString &hash);
    mcp::json getTokenHolders(int chainId, const QString &hash);
    mcp::json getTokenCounters(int chainId, const QString &hash);
    mcp::json getTokenInstances(int chainId, const QString &hash);
    mcp::json getTokenInstanceInfo(int chainId, const QString &hash, quint64 tokenId);
    mcp::json getTokenInstanceTransfers(int chainId, const QString &hash, quint64 tokenId);
    mcp::json getTokenInstanceHolders(int chainId, const QString &hash, quint64 tokenId);
    mcp::json getTokenInstanceTransfersCount(int chainId, const QString &hash, quint64 tokenId);

  private:
    std::unique_ptr<IHttpFetcher> fetcher_; // 需先于 registry_ 构造
    ChainRegistry registry_;
};
