#pragma once

#include <QString>
#include <QUrlQuery>

// explorer 列表接口的可选查询参数；空字符串表示不发送该参数

struct SearchParams
{
    QString q;

    QUrlQuery toQuery() const;
};

struct GetTransactionsParams
{
    QString filter; // pending | validated
    QString type;   // token_transfer,contract_creation,...
    QString method; // approve,transfer,...

    QUrlQuery toQuery() const;
};

struct GetBlocksParams
{
    QString type; // block | uncle | reorg

    QUrlQuery toQuery() const;
};

struct GetTransactionTokenTransfersParams
{
    QString type;

    QUrlQuery toQuery() const;
};

struct GetAddressTransactionsParams
{
    QString filter; // to | from

    QUrlQuery toQuery() const;
};

struct GetAddressTokenTransfersParams
{
    QString type;
    QString filter;
    QString token;

    QUrlQuery toQuery() const;
};

struct GetAddressInternalTransactionsParams
{
    QString filter;

    QUrlQuery toQuery() const;
};

struct GetAddressTokensParams
{
    QString type; // ERC-20,ERC-721,ERC-1155

    QUrlQuery toQuery() const;
};

struct GetAddressNftsParams
{
    QString type;

    QUrlQuery toQuery() const;
};

struct GetTokensParams
{
    QString q;
    QString type;

    QUrlQuery toQuery() const;
};
