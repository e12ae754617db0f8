#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include "app_context.h"

class QSettings;

// 应用启动装配器：集中处理命令行、环境变量与 INI 配置。
class AppBootstrap
{
public:
    struct Result
    {
        enum Action
        {
            Run,
            ShowHelp,
            ShowVersion,
            Fail, // 配置或命令行错误，进程以 ONCHAIN_EXIT_CONFIG 退出
        };

        Action action = Run;
        AppContext context;
        QString message; // ShowHelp/ShowVersion 时为输出文本，Fail 时为错误说明
    };

    // arguments 含程序名（即 QCoreApplication::arguments()）。
    static Result bootstrap(const QStringList &arguments, const QProcessEnvironment &env);

    // 内置默认值（含 Merlin 浏览器地址）。
    static AppContext defaults();

    // 读取 INI 中出现的键，覆盖 ctx 中的对应字段。
    static void applySettings(AppContext &ctx, QSettings &settings);

    // 读取 ONCHAIN_* 环境变量。
    static void applyEnvironment(AppContext &ctx, const QProcessEnvironment &env);
};
