#ifndef NET_RETRY_POLICY_H
#define NET_RETRY_POLICY_H

#include <QNetworkReply>
#include <QtGlobal>

// 网络重试策略：
// - explorer 请求均为幂等 GET，可整体重发。
// - 通过 HTTP 状态码与网络错误类型判断是否属于短暂故障。
struct RetryPolicy
{
    int maxRetries = 2;
    int baseDelayMs = 400;
    int maxDelayMs = 4000;
};

inline bool isRetryableHttpStatus(int httpCode)
{
    return httpCode == 408 || httpCode == 409 || httpCode == 425 || httpCode == 429 || (httpCode >= 500 && httpCode <= 599);
}

inline bool isRetryableNetworkError(QNetworkReply::NetworkError error)
{
    switch (error)
    {
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError: // 超时定时器 abort() 后的错误类型
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::ServiceUnavailableError:
    case QNetworkReply::InternalServerError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyTimeoutError:
        return true;
    default:
        break;
    }
    return false;
}

// httpCode 为 0 表示未收到 HTTP 响应（纯网络错误）
inline bool shouldRetryExplorerRequest(QNetworkReply::NetworkError error, int httpCode, int retriesUsed, const RetryPolicy &policy)
{
    if (policy.maxRetries <= 0) return false;
    if (retriesUsed >= policy.maxRetries) return false;
    if (httpCode == 200) return false;
    if (httpCode > 0) return isRetryableHttpStatus(httpCode);
    return isRetryableNetworkError(error);
}

inline int nextRetryBackoffMs(int retriesUsed, const RetryPolicy &policy)
{
    const int safeBase = qMax(1, policy.baseDelayMs);
    const int safeMax = qMax(safeBase, policy.maxDelayMs);
    const int shift = qBound(0, retriesUsed, 10);
    const qint64 delay = qMin<qint64>(qint64(safeBase) << shift, safeMax);
    return int(delay);
}

#endif // NET_RETRY_POLICY_H
