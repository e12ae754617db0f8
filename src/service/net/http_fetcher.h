#pragma once

#include <QByteArray>
#include <QNetworkReply>
#include <QString>
#include <QUrl>
#include <atomic>

#include "utils/net_retry_policy.h"

// 一次 GET 的结果快照；status 为 0 表示没有收到 HTTP 响应。
struct HttpResponse
{
    int status = 0;
    QString reason; // HTTP reason phrase, e.g. "Not Found"
    QByteArray body;
    QNetworkReply::NetworkError error = QNetworkReply::NoError;
    QString errorString;
    bool timedOut = false;
    bool cancelled = false;
    int attempts = 1;

    bool isOk() const { return status == 200; }
    QString statusText() const; // 无 reason phrase 时（如 HTTP/2）使用标准短语

    static QString canonicalReason(int status);
};

struct HttpFetcherOptions
{
    int timeoutMs = 30000;
    RetryPolicy retry;
    QByteArray userAgent;
};

// explorer 与注册表共用的 HTTP 接口；实现需可在多个工作线程中同时调用
class IHttpFetcher
{
  public:
    virtual ~IHttpFetcher() = default;
    virtual HttpResponse get(const QUrl &url) = 0;
    // 中止进行中的请求并拒绝后续请求（进程退出时调用，可在任意线程调用）
    virtual void cancel() = 0;
};

// 基于 QNetworkAccessManager 的实现：每次请求在调用线程内创建 manager 并用局部事件循环等待，
// 因此可在 QtConcurrent 工作线程中直接阻塞调用。
class QtHttpFetcher : public IHttpFetcher
{
  public:
    explicit QtHttpFetcher(HttpFetcherOptions options = {});

    HttpResponse get(const QUrl &url) override;
    void cancel() override;
    bool isCancelled() const { return cancelled_.load(); }

    const HttpFetcherOptions &options() const { return options_; }

  private:
    HttpResponse getOnce(const QUrl &url) const;
    HttpResponse cancelledResponse() const;
    bool waitBackoff(int delayMs) const;

    HttpFetcherOptions options_;
    std::atomic<bool> cancelled_{false};
};
