#include "service/net/http_fetcher.h"

#include "utils/log_categories.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QThread>
#include <QTimer>

namespace
{
// 取消标志的轮询间隔
constexpr int kCancelPollMs = 50;
} // namespace

QString HttpResponse::canonicalReason(int status)
{
    switch (status)
    {
    case 200: return QStringLiteral("OK");
    case 201: return QStringLiteral("Created");
    case 202: return QStringLiteral("Accepted");
    case 204: return QStringLiteral("No Content");
    case 206: return QStringLiteral("Partial Content");
    case 301: return QStringLiteral("Moved Permanently");
    case 302: return QStringLiteral("Found");
    case 303: return QStringLiteral("See Other");
    case 304: return QStringLiteral("Not Modified");
    case 307: return QStringLiteral("Temporary Redirect");
    case 308: return QStringLiteral("Permanent Redirect");
    case 400: return QStringLiteral("Bad Request");
    case 401: return QStringLiteral("Unauthorized");
    case 402: return QStringLiteral("Payment Required");
    case 403: return QStringLiteral("Forbidden");
    case 404: return QStringLiteral("Not Found");
    case 405: return QStringLiteral("Method Not Allowed");
    case 406: return QStringLiteral("Not Acceptable");
    case 407: return QStringLiteral("Proxy Authentication Required");
    case 408: return QStringLiteral("Request Timeout");
    case 409: return QStringLiteral("Conflict");
    case 410: return QStringLiteral("Gone");
    case 411: return QStringLiteral("Length Required");
    case 412: return QStringLiteral("Precondition Failed");
    case 413: return QStringLiteral("Payload Too Large");
    case 414: return QStringLiteral("URI Too Long");
    case 415: return QStringLiteral("Unsupported Media Type");
    case 416: return QStringLiteral("Range Not Satisfiable");
    case 417: return QStringLiteral("Expectation Failed");
    case 418: return QStringLiteral("I'm a teapot");
    case 421: return QStringLiteral("Misdirected Request");
    case 422: return QStringLiteral("Unprocessable Entity");
    case 423: return QStringLiteral("Locked");
    case 424: return QStringLiteral("Failed Dependency");
    case 425: return QStringLiteral("Too Early");
    case 426: return QStringLiteral("Upgrade Required");
    case 428: return QStringLiteral("Precondition Required");
    case 429: return QStringLiteral("Too Many Requests");
    case 431: return QStringLiteral("Request Header Fields Too Large");
    case 451: return QStringLiteral("Unavailable For Legal Reasons");
    case 500: return QStringLiteral("Internal Server Error");
    case 501: return QStringLiteral("Not Implemented");
    case 502: return QStringLiteral("Bad Gateway");
    case 503: return QStringLiteral("Service Unavailable");
    case 504: return QStringLiteral("Gateway Timeout");
    case 505: return QStringLiteral("HTTP Version Not Supported");
    case 506: return QStringLiteral("Variant Also Negotiates");
    case 507: return QStringLiteral("Insufficient Storage");
    case 508: return QStringLiteral("Loop Detected");
    case 510: return QStringLiteral("Not Extended");
    case 511: return QStringLiteral("Network Authentication Required");
    default: break;
    }
    return QString();
}

QString HttpResponse::statusText() const
{
    if (status > 0)
    {
        const QString phrase = reason.isEmpty() ? canonicalReason(status) : reason;
        return phrase.isEmpty() ? QString::number(status) : QStringLiteral("%1 %2").arg(QString::number(status), phrase);
    }
    if (cancelled) return QStringLiteral("cancelled");
    if (timedOut) return QStringLiteral("timeout");
    return errorString.isEmpty() ? QStringLiteral("network error") : errorString;
}

QtHttpFetcher::QtHttpFetcher(HttpFetcherOptions options)
    : options_(std::move(options))
{
    if (options_.timeoutMs <= 0) options_.timeoutMs = 30000;
}

void QtHttpFetcher::cancel()
{
    if (cancelled_.exchange(true)) return;
    qCInfo(lcNet) << "http fetcher cancelled, pending requests will be aborted";
}

HttpResponse QtHttpFetcher::cancelledResponse() const
{
    HttpResponse response;
    response.cancelled = true;
    response.error = QNetworkReply::OperationCanceledError;
    response.errorString = QStringLiteral("request cancelled");
    return response;
}

bool QtHttpFetcher::waitBackoff(int delayMs) const
{
    // 分片睡眠，退出时不必等满整个退避间隔
    int remaining = delayMs;
    while (remaining > 0)
    {
        if (cancelled_.load()) return false;
        const int slice = qMin(remaining, kCancelPollMs);
        QThread::msleep(static_cast<unsigned long>(slice));
        remaining -= slice;
    }
    return !cancelled_.load();
}

HttpResponse QtHttpFetcher::get(const QUrl &url)
{
    int retriesUsed = 0;
    for (;;)
    {
        HttpResponse response = cancelled_.load() ? cancelledResponse() : getOnce(url);
        response.attempts = retriesUsed + 1;
        if (response.cancelled) return response;
        if (!shouldRetryExplorerRequest(response.error, response.status, retriesUsed, options_.retry))
        {
            return response;
        }
        const int delayMs = nextRetryBackoffMs(retriesUsed, options_.retry);
        qCWarning(lcNet).noquote() << QStringLiteral("GET %1 failed (%2), retry %3/%4 in %5 ms")
                                          .arg(url.toString(QUrl::RemoveQuery), response.statusText())
                                          .arg(retriesUsed + 1)
                                          .arg(options_.retry.maxRetries)
                                          .arg(delayMs);
        ++retriesUsed;
        if (!waitBackoff(delayMs))
        {
            HttpResponse cancelled = cancelledResponse();
            cancelled.attempts = retriesUsed;
            return cancelled;
        }
    }
}

HttpResponse QtHttpFetcher::getOnce(const QUrl &url) const
{
    HttpResponse response;

    // manager 与 reply 均在调用线程创建，随作用域结束销毁
    QNetworkAccessManager nam;
    QNetworkRequest request(url);
    request.setRawHeader("Accept", "application/json");
    if (!options_.userAgent.isEmpty())
    {
        request.setHeader(QNetworkRequest::UserAgentHeader, options_.userAgent);
    }
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    const bool allowHttp2 = (url.scheme().compare(QStringLiteral("https"), Qt::CaseInsensitive) == 0);
    request.setAttribute(QNetworkRequest::Http2AllowedAttribute, allowHttp2);

    qCDebug(lcNet).noquote() << "GET" << url.toString();
    QNetworkReply *reply = nam.get(request);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QTimer cancelPoll;
    cancelPoll.setInterval(kCancelPollMs);
    bool timedOut = false;
    bool cancelled = false;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]()
                     {
                         if (reply->isFinished()) return;
                         timedOut = true;
                         reply->abort();
                         loop.quit();
                     });
    QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&]()
                     {
                         if (!cancelled_.load() || reply->isFinished()) return;
                         cancelled = true;
                         reply->abort();
                         loop.quit();
                     });
    timer.start(options_.timeoutMs);
    cancelPoll.start();
    if (!reply->isFinished()) loop.exec();
    timer.stop();
    cancelPoll.stop();

    if (cancelled)
    {
        qCDebug(lcNet).noquote() << "GET" << url.toString(QUrl::RemoveQuery) << "cancelled";
        return cancelledResponse();
    }
    response.timedOut = timedOut;
    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.reason = QString::fromUtf8(reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toByteArray()).trimmed();
    response.error = timedOut ? QNetworkReply::TimeoutError : reply->error();
    response.errorString = timedOut ? QStringLiteral("request timed out after %1 ms").arg(options_.timeoutMs) : reply->errorString();
    if (!timedOut) response.body = reply->readAll();
    if (timedOut) response.status = 0;
    return response;
}
