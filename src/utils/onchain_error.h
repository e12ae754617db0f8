#ifndef ONCHAIN_ERROR_H
#define ONCHAIN_ERROR_H

#include <QString>
#include <stdexcept>

// 统一错误码：
// - 目标：日志可稳定匹配错误类别，返回给客户端的文案保持原样。
// - 约定：
//   - NET = explorer/注册表 HTTP 链路
//   - REG = 链注册表解析
//   - API = explorer 响应内容
//   - TOOL = 工具参数与路由
//   - CFG = 启动配置
enum class OnchainErrorCode
{
    None = 0,
    NetRequestFailed,
    NetTimeout,
    RegistryLookupFailed,
    RegistryNoExplorers,
    ApiInvalidJson,
    ToolInvalidArguments,
    ToolUnknown,
    ConfigInvalid,
};

inline QString onchainErrorCodeTag(OnchainErrorCode code)
{
    switch (code)
    {
    case OnchainErrorCode::NetRequestFailed: return QStringLiteral("ONC-NET-001");
    case OnchainErrorCode::NetTimeout: return QStringLiteral("ONC-NET-002");
    case OnchainErrorCode::RegistryLookupFailed: return QStringLiteral("ONC-REG-001");
    case OnchainErrorCode::RegistryNoExplorers: return QStringLiteral("ONC-REG-002");
    case OnchainErrorCode::ApiInvalidJson: return QStringLiteral("ONC-API-001");
    case OnchainErrorCode::ToolInvalidArguments: return QStringLiteral("ONC-TOOL-001");
    case OnchainErrorCode::ToolUnknown: return QStringLiteral("ONC-TOOL-002");
    case OnchainErrorCode::ConfigInvalid: return QStringLiteral("ONC-CFG-001");
    case OnchainErrorCode::None:
    default:
        break;
    }
    return QStringLiteral("ONC-UNKNOWN");
}

inline QString formatOnchainError(OnchainErrorCode code, const QString &message)
{
    if (code == OnchainErrorCode::None) return message;
    return QStringLiteral("[%1] %2").arg(onchainErrorCodeTag(code), message);
}

// explorer / 注册表 / 网络失败，映射为 JSON-RPC internal error
class explorer_exception : public std::runtime_error
{
  public:
    explorer_exception(OnchainErrorCode code, const QString &message)
        : std::runtime_error(message.toStdString()), code_(code)
    {
    }

    OnchainErrorCode code() const noexcept { return code_; }

  private:
    OnchainErrorCode code_;
};

// 工具参数缺失/类型错误或工具不存在，映射为 JSON-RPC invalid params
class tool_argument_exception : public std::runtime_error
{
  public:
    explicit tool_argument_exception(const QString &message, OnchainErrorCode code = OnchainErrorCode::ToolInvalidArguments)
        : std::runtime_error(message.toStdString()), code_(code)
    {
    }

    OnchainErrorCode code() const noexcept { return code_; }

  private:
    OnchainErrorCode code_;
};

#endif // ONCHAIN_ERROR_H
