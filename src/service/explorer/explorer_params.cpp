#include "service/explorer/explorer_params.h"

#include <QUrl>

namespace
{
void addIfSet(QUrlQuery &query, const QString &key, const QString &value)
{
    if (value.isEmpty()) return;
    // QUrlQuery 默认保留 '+' 与 '&' 等字符，先整体编码
    query.addQueryItem(key, QString::fromLatin1(QUrl::toPercentEncoding(value)));
}
} // namespace

QUrlQuery SearchParams::toQuery() const
{
    QUrlQuery query;
    addIfSet(query, QStringLiteral("q"), q);
    return query;
}

QUrlQuery GetTransactionsParams::toQuery() const
{
    QUrlQuery query;
    addIfSet(query, QStringLiteral("filter"), filter);
    addIfSet(query, QStringLiteral("type"), type);
    addIfSet(query, QStringLiteral("method"), method);
    return query;
}

QUrlQuery GetBlocksParams::toQuery() const
{
    QUrlQuery query;
    addIfSet(query, QStringLiteral("type"), type);
    return query;
}

QUrlQuery GetTransactionTokenTransfersParams::toQuery() const
{
    QUrlQuery query;
    addIfSet(query, QStringLiteral("type"), type);
    return query;
}

QUrlQuery GetAddressTransactionsParams::toQuery() const
{
    QUrlQuery query;
    addIfSet(query, QStringLiteral("filter"), filter);
    return query;
}

QUrlQuery GetAddressTokenTransfersParams::toQuery() const
{
    QUrlQuery query;
    addIfSet(query, QStringLiteral("type"), type);
    addIfSet(query, QStringLiteral("filter"), filter);
    addIfSet(query, QStringLiteral("token"), token);
    return query;
}

QUrlQuery GetAddressInternalTransactionsParams::toQuery() const
{
    QUrlQuery query;
    addIfSet(query, QStringLiteral("filter"), filter);
    return query;
}

QUrlQuery GetAddressTokensParams::toQuery() const
{
    QUrlQuery query;
    addIfSet(query, QStringLiteral("type"), type);
    return query;
}

QUrlQuery GetAddressNftsParams::toQuery() const
{
    QUrlQuery query;
    addIfSet(query, QStringLiteral("type"), type);
    return query;
}

QUrlQuery GetTokensParams::toQuery() const
{
    QUrlQuery query;
    addIfSet(query, QStringLiteral("q"), q);
    addIfSet(query, QStringLiteral("type"), type);
    return query;
}
