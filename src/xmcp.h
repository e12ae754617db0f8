// xmcp.h
#ifndef XMCP_H
#define XMCP_H

#include "cmakeconfig.h"
#include "mcp_json.h"
#include "xconfig.h"

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QThreadPool>
#include <memory>

class ToolRegistry;

// tools/list 与 tools/call 的后端；callTool 会在工作线程中被并发调用
class IMcpToolController
{
  public:
    virtual ~IMcpToolController() = default;
    virtual mcp::json listTools() const = 0;
    virtual mcp::json callTool(const QString &toolName, const mcp::json &arguments) = 0;
};

// 默认实现：直接转发给只读的 ToolRegistry，registry 需比 controller 存活更久
class RegistryToolController : public IMcpToolController
{
  public:
    explicit RegistryToolController(const ToolRegistry &registry);
    mcp::json listTools() const override;
    mcp::json callTool(const QString &toolName, const mcp::json &arguments) override;

  private:
    const ToolRegistry &registry_;
};

struct xMcpOptions
{
    int maxConcurrentCalls = DEFAULT_MAX_CONCURRENT_CALLS;
    QString serverName = QStringLiteral(ONCHAIN_SERVER_NAME);
    QString serverVersion = QStringLiteral(ONCHAIN_VERSION);
    QString instructions = QStringLiteral(DEFAULT_INSTRUCTIONS);
};

// MCP 服务端：逐行接收 JSON-RPC 消息并产出响应行
// initialize/ping/tools/list 在调用线程同步应答；tools/call 交给线程池，完成后回到本对象线程发出 responseReady
class xMcp : public QObject
{
    Q_OBJECT
  public:
    explicit xMcp(QObject *parent = nullptr,
                  std::unique_ptr<IMcpToolController> controller = nullptr,
                  xMcpOptions options = {});
    ~xMcp() override;

    // 返回需要立即写出的响应；通知与异步执行的 tools/call 返回 null
    mcp::json handleMessage(const mcp::json &message);

    int inFlightCalls() const { return inFlight_; }
    bool isInitialized() const { return initialized_; }
    bool isClosing() const { return closing_; }
    const xMcpOptions &options() const { return options_; }

    static QByteArray serialize(const mcp::json &message);

  public slots:
    void handleLine(const QByteArray &line);
    void inputClosed(); // 输入结束：不再接收新请求，等待在途调用完成后发出 drained

  signals:
    void responseReady(const QByteArray &line); // 不含结尾换行
    void drained();

  private:
    mcp::json handleInitialize(const mcp::json &id, const mcp::json &params);
    mcp::json startToolCall(const mcp::json &id, const mcp::json &params);
    mcp::json executeToolCall(const mcp::json &id, const QString &toolName, const mcp::json &arguments);
    void finishToolCall(const QByteArray &line);
    void maybeDrained();

    std::unique_ptr<IMcpToolController> controller_;
    xMcpOptions options_;
    QThreadPool pool_;
    int inFlight_ = 0;
    bool initialized_ = false;
    bool closing_ = false;
    bool drainedEmitted_ = false;
};

#endif // XMCP_H
