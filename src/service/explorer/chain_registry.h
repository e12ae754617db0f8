#pragma once

#include <QHash>
#include <QReadWriteLock>
#include <QString>
#include <QVector>

#include "mcp_json.h"

class IHttpFetcher;

struct ChainExplorer
{
    QString url;
};

// 注册表中的一条链记录（chains.blockscout.com/api/chains/{id}）
struct Chain
{
    QString name;
    QString description;
    bool isTestnet = false;
    QVector<ChainExplorer> explorers;

    // First explorer URL; throws explorer_exception when the chain lists none.
    QString explorerUrl() const;

    // Throws explorer_exception when the payload is not a chain object.
    static Chain fromJson(const mcp::json &object);
};

// chain id -> explorer 基地址解析，带进程内缓存
// 读锁命中缓存直接返回；未命中时持写锁访问注册表，保证同一时刻只有一次注册表请求
class ChainRegistry
{
  public:
    ChainRegistry(IHttpFetcher &fetcher, QString registryUrl, QHash<int, QString> explorerOverrides = defaultExplorerOverrides());

    Chain getChain(int chainId);
    // Base URL ending with '/', overrides consulted before the registry.
    QString explorerUrl(int chainId);

    int cachedChainCount() const;
    void clear();

    const QString &registryUrl() const { return registryUrl_; }

    static QHash<int, QString> defaultExplorerOverrides();
    static QString normalizeBaseUrl(QString url);

  private:
    Chain fetchChain(int chainId) const;

    IHttpFetcher &fetcher_;
    QString registryUrl_;
    QHash<int, QString> overrides_;
    mutable QReadWriteLock lock_;
    QHash<int, Chain> cache_;
};
