#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <QFuture>
#include <QHostAddress>
#include <QList>
#include <QQueue>
#include <QTcpServer>
#include <QTcpSocket>
#include <QtConcurrent/QtConcurrentRun>
#include <QtTest/QTest>
#include <memory>

#include "common/TestUtils.h"
#include "service/net/http_fetcher.h"

namespace
{
// 本地 HTTP/1.1 桩服务：按顺序回放预置的原始响应并记录收到的请求头；
// 队列为空时保持连接不回复
class ScriptedHttpServer : public QObject
{
  public:
    ScriptedHttpServer()
    {
        listening_ = server_.listen(QHostAddress::LocalHost, 0);
        QObject::connect(&server_, &QTcpServer::newConnection, this, [this]() { acceptPending(); });
    }

    bool isListening() const { return listening_; }

    QUrl url(const QString &path) const
    {
        return QUrl(QStringLiteral("http://127.0.0.1:%1%2").arg(server_.serverPort()).arg(path));
    }

    void enqueue(int status, const QByteArray &reason, const QByteArray &body = QByteArray())
    {
        QByteArray raw = "HTTP/1.1 " + QByteArray::number(status) + ' ' + reason + "\r\n";
        raw += "Content-Type: application/json\r\n";
        raw += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
        raw += "Connection: close\r\n\r\n";
        raw += body;
        replies_.enqueue(raw);
    }

    QList<QByteArray> requests() const { return requests_; }
    int requestCount() const { return requests_.size(); }

  private:
    void acceptPending()
    {
        while (QTcpSocket *socket = server_.nextPendingConnection())
        {
            auto buffer = std::make_shared<QByteArray>();
            QObject::connect(socket, &QTcpSocket::readyRead, this, [this, socket, buffer]()
                             {
                                 buffer->append(socket->readAll());
                                 if (!buffer->contains("\r\n\r\n")) return;
                                 requests_ << *buffer;
                                 buffer->clear();
                                 if (replies_.isEmpty()) return;
                                 socket->write(replies_.dequeue());
                                 socket->disconnectFromHost();
                             });
            QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        }
    }

    QTcpServer server_;
    bool listening_ = false;
    QQueue<QByteArray> replies_;
    QList<QByteArray> requests_;
};

HttpFetcherOptions fastOptions(int timeoutMs, int maxRetries)
{
    HttpFetcherOptions options;
    options.timeoutMs = timeoutMs;
    options.retry.maxRetries = maxRetries;
    options.retry.baseDelayMs = 1;
    options.retry.maxDelayMs = 1;
    options.userAgent = QByteArrayLiteral("onchain-mcp/test");
    return options;
}
} // namespace

TEST_CASE("statusText prefers the HTTP status line")
{
    HttpResponse response;
    response.status = 404;
    response.reason = QStringLiteral("Not Found");
    CHECK(response.statusText() == QStringLiteral("404 Not Found"));

    response.reason = QStringLiteral("Nope");
    CHECK(response.statusText() == QStringLiteral("404 Nope"));
    CHECK_FALSE(response.isOk());
}

TEST_CASE("statusText falls back to the standard reason phrase")
{
    // HTTP/2 响应不带 reason phrase
    HttpResponse response;
    response.status = 404;
    CHECK(response.statusText() == QStringLiteral("404 Not Found"));
    response.status = 503;
    CHECK(response.statusText() == QStringLiteral("503 Service Unavailable"));
    response.status = 429;
    CHECK(response.statusText() == QStringLiteral("429 Too Many Requests"));
    response.status = 599;
    CHECK(response.statusText() == QStringLiteral("599"));
    CHECK(HttpResponse::canonicalReason(200) == QStringLiteral("OK"));
    CHECK(HttpResponse::canonicalReason(0).isEmpty());
}

TEST_CASE("statusText reports timeouts and transport errors")
{
    HttpResponse timedOut;
    timedOut.timedOut = true;
    CHECK(timedOut.statusText() == QStringLiteral("timeout"));

    HttpResponse refused;
    refused.error = QNetworkReply::ConnectionRefusedError;
    refused.errorString = QStringLiteral("Connection refused");
    CHECK(refused.statusText() == QStringLiteral("Connection refused"));

    HttpResponse unknown;
    CHECK(unknown.statusText() == QStringLiteral("network error"));

    HttpResponse cancelled;
    cancelled.cancelled = true;
    CHECK(cancelled.statusText() == QStringLiteral("cancelled"));
}

TEST_CASE("only status 200 counts as success")
{
    HttpResponse response;
    response.status = 200;
    CHECK(response.isOk());
    response.status = 204;
    CHECK_FALSE(response.isOk());
}

TEST_CASE("QtHttpFetcher replaces a non-positive timeout with the default")
{
    HttpFetcherOptions options;
    options.timeoutMs = 0;
    QtHttpFetcher fetcher(options);
    CHECK(fetcher.options().timeoutMs == 30000);
}

TEST_CASE("QtHttpFetcher retries a refused connection and then gives up")
{
    onchain::test::ensureQtApp();
    HttpFetcherOptions options;
    options.timeoutMs = 5000;
    options.retry.maxRetries = 1;
    options.retry.baseDelayMs = 1;
    options.retry.maxDelayMs = 1;
    QtHttpFetcher fetcher(options);

    const HttpResponse response = fetcher.get(QUrl(QStringLiteral("http://127.0.0.1:1/api/chains/1")));
    CHECK(response.status == 0);
    CHECK_FALSE(response.isOk());
    CHECK(response.attempts == 2);
    CHECK(response.error != QNetworkReply::NoError);
}

TEST_CASE("QtHttpFetcher sends json accept and user agent headers")
{
    onchain::test::ensureQtApp();
    ScriptedHttpServer server;
    REQUIRE(server.isListening());
    server.enqueue(200, "OK", R"({"ok":true})");

    QtHttpFetcher fetcher(fastOptions(5000, 0));
    const HttpResponse response = fetcher.get(server.url(QStringLiteral("/api/v2/stats")));
    CHECK(response.isOk());
    CHECK(response.body == QByteArray(R"({"ok":true})"));
    CHECK(response.attempts == 1);

    REQUIRE(server.requestCount() == 1);
    const QByteArray head = server.requests().first().toLower();
    CHECK(head.startsWith("get /api/v2/stats http/1.1"));
    CHECK(head.contains("accept: application/json"));
    CHECK(head.contains("user-agent: onchain-mcp/test"));
}

TEST_CASE("QtHttpFetcher retries a transient status and returns the later success")
{
    onchain::test::ensureQtApp();
    ScriptedHttpServer server;
    REQUIRE(server.isListening());
    server.enqueue(503, "Service Unavailable");
    server.enqueue(200, "OK", R"([1,2,3])");

    QtHttpFetcher fetcher(fastOptions(5000, 2));
    const HttpResponse response = fetcher.get(server.url(QStringLiteral("/api/v2/blocks")));
    CHECK(response.status == 200);
    CHECK(response.attempts == 2);
    CHECK(response.body == QByteArray("[1,2,3]"));
    CHECK(server.requestCount() == 2);
}

TEST_CASE("QtHttpFetcher reads the reason phrase from the status line")
{
    onchain::test::ensureQtApp();
    ScriptedHttpServer server;
    REQUIRE(server.isListening());
    server.enqueue(404, "Not Found");
    server.enqueue(418, "Custom Phrase");

    QtHttpFetcher fetcher(fastOptions(5000, 2));
    const HttpResponse missing = fetcher.get(server.url(QStringLiteral("/api/v2/addresses/0x1")));
    CHECK(missing.status == 404);
    CHECK(missing.attempts == 1);
    CHECK(missing.statusText() == QStringLiteral("404 Not Found"));

    const HttpResponse custom = fetcher.get(server.url(QStringLiteral("/api/v2/addresses/0x2")));
    CHECK(custom.status == 418);
    CHECK(custom.reason == QStringLiteral("Custom Phrase"));
    CHECK(custom.statusText() == QStringLiteral("418 Custom Phrase"));
}

TEST_CASE("QtHttpFetcher aborts a silent server after the timeout")
{
    onchain::test::ensureQtApp();
    ScriptedHttpServer server;
    REQUIRE(server.isListening());

    QtHttpFetcher fetcher(fastOptions(300, 0));
    const HttpResponse response = fetcher.get(server.url(QStringLiteral("/api/v2/stats")));
    CHECK(response.timedOut);
    CHECK(response.status == 0);
    CHECK(response.error == QNetworkReply::TimeoutError);
    CHECK(response.body.isEmpty());
    CHECK(response.statusText() == QStringLiteral("timeout"));
}

TEST_CASE("QtHttpFetcher cancel aborts an in-flight request and refuses new ones")
{
    onchain::test::ensureQtApp();
    ScriptedHttpServer server;
    REQUIRE(server.isListening());

    QtHttpFetcher fetcher(fastOptions(20000, 0));
    const QUrl url = server.url(QStringLiteral("/api/v2/stats"));
    QFuture<HttpResponse> future = QtConcurrent::run([&fetcher, url]() { return fetcher.get(url); });

    REQUIRE(QTest::qWaitFor([&server]() { return server.requestCount() == 1; }, 5000));
    fetcher.cancel();
    REQUIRE(QTest::qWaitFor([&future]() { return future.isFinished(); }, 2000));

    const HttpResponse response = future.result();
    CHECK(response.cancelled);
    CHECK_FALSE(response.timedOut);
    CHECK(response.status == 0);
    CHECK(response.statusText() == QStringLiteral("cancelled"));
    CHECK(fetcher.isCancelled());

    const HttpResponse after = fetcher.get(url);
    CHECK(after.cancelled);
    CHECK(server.requestCount() == 1);
}

TEST_CASE("QtHttpFetcher cancel cuts the retry backoff short")
{
    onchain::test::ensureQtApp();
    ScriptedHttpServer server;
    REQUIRE(server.isListening());
    server.enqueue(503, "Service Unavailable");

    HttpFetcherOptions options = fastOptions(5000, 1);
    options.retry.baseDelayMs = 10000;
    options.retry.maxDelayMs = 10000;
    QtHttpFetcher fetcher(options);
    const QUrl url = server.url(QStringLiteral("/api/v2/stats"));
    QFuture<HttpResponse> future = QtConcurrent::run([&fetcher, url]() { return fetcher.get(url); });

    REQUIRE(QTest::qWaitFor([&server]() { return server.requestCount() == 1; }, 5000));
    QTest::qWait(100);
    fetcher.cancel();
    REQUIRE(QTest::qWaitFor([&future]() { return future.isFinished(); }, 2000));
    CHECK(future.result().cancelled);
    CHECK(server.requestCount() == 1);
}
