#include "startuplogger.h"

#include "log_categories.h"

#include <QElapsedTimer>
#include <QMutex>
#include <QMutexLocker>

namespace
{
QElapsedTimer g_timer;
bool g_started = false;
QMutex g_mutex;
} // namespace

void StartupLogger::start()
{
    QMutexLocker locker(&g_mutex);
    g_timer.start();
    g_started = true;
}

void StartupLogger::log(const QString &step)
{
    QMutexLocker locker(&g_mutex);
    if (!g_started) return;
    qCInfo(lcApp).noquote() << QStringLiteral("[startup] %1 @ %2 ms").arg(step, QString::number(g_timer.elapsed()));
}

qint64 StartupLogger::elapsedMs()
{
    QMutexLocker locker(&g_mutex);
    return g_started ? g_timer.elapsed() : -1;
}
