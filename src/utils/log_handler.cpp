#include "log_handler.h"

#include <QAtomicInt>
#include <QMutex>
#include <QMutexLocker>
#include <QTime>

#include <cstdio>

namespace
{
QAtomicInt g_minSeverity(1);
QMutex g_writeMutex;

QString levelLabel(QtMsgType type)
{
    switch (type)
    {
    case QtDebugMsg: return QStringLiteral("debug");
    case QtInfoMsg: return QStringLiteral("info");
    case QtWarningMsg: return QStringLiteral("warning");
    case QtCriticalMsg: return QStringLiteral("critical");
    case QtFatalMsg: return QStringLiteral("fatal");
    }
    return QStringLiteral("unknown");
}

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    if (LogHandler::severity(type) < g_minSeverity.loadAcquire()) return;
    const QByteArray line = LogHandler::formatLine(type, context.category, message).toUtf8();
    QMutexLocker locker(&g_writeMutex);
    std::fwrite(line.constData(), 1, size_t(line.size()), stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}
} // namespace

int LogHandler::severity(QtMsgType type)
{
    switch (type)
    {
    case QtDebugMsg: return 0;
    case QtInfoMsg: return 1;
    case QtWarningMsg: return 2;
    case QtCriticalMsg: return 3;
    case QtFatalMsg: return 4;
    }
    return 4;
}

bool LogHandler::parseLevel(const QString &name, QtMsgType *level)
{
    const QString key = name.trimmed().toLower();
    QtMsgType parsed;
    if (key == QLatin1String("debug"))
        parsed = QtDebugMsg;
    else if (key == QLatin1String("info"))
        parsed = QtInfoMsg;
    else if (key == QLatin1String("warning") || key == QLatin1String("warn"))
        parsed = QtWarningMsg;
    else if (key == QLatin1String("critical") || key == QLatin1String("error"))
        parsed = QtCriticalMsg;
    else
        return false;
    if (level) *level = parsed;
    return true;
}

QString LogHandler::formatLine(QtMsgType type, const char *category, const QString &message)
{
    const QString categoryName = (category && *category) ? QString::fromLatin1(category) : QStringLiteral("default");
    return QStringLiteral("[%1][%2][%3] %4")
        .arg(QTime::currentTime().toString(QStringLiteral("hh:mm:ss.zzz")), levelLabel(type), categoryName, message);
}

void LogHandler::install(QtMsgType minLevel)
{
    g_minSeverity.storeRelease(severity(minLevel));
    qInstallMessageHandler(messageHandler);
}
