#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

#include "xconfig.h"

// 启动阶段解析出的运行配置（只读快照）。
// 约定：由 AppBootstrap 按 默认值 < INI < 环境变量 < 命令行 的顺序合成，之后仅作为只读配置传递。
struct AppContext
{
    QString appDir;     // 可执行程序所在目录
    QString configPath; // 实际加载的 INI 文件；为空表示未使用配置文件

    QString registryUrl = QStringLiteral(DEFAULT_REGISTRY_URL);
    int httpTimeoutMs = DEFAULT_HTTP_TIMEOUT_MS;
    int httpMaxRetries = DEFAULT_HTTP_MAX_RETRIES;
    int httpRetryBaseMs = DEFAULT_HTTP_RETRY_BASE_MS;
    int httpRetryMaxMs = DEFAULT_HTTP_RETRY_MAX_MS;
    int maxConcurrentCalls = DEFAULT_MAX_CONCURRENT_CALLS;
    QString logLevel = QStringLiteral(DEFAULT_LOG_LEVEL);

    // chain id -> explorer 基地址，优先于注册表
    QHash<int, QString> explorerOverrides;

    bool listTools = false; // --list-tools：打印工具清单后退出

    // 被忽略的配置项说明；日志系统安装后再输出
    QStringList warnings;
};
