#ifndef LOG_HANDLER_H
#define LOG_HANDLER_H

#include <QString>
#include <QtGlobal>

// stdout 只承载协议消息，所有日志统一写到 stderr
namespace LogHandler
{
// Install the process-wide Qt message handler. Messages below minLevel are dropped.
void install(QtMsgType minLevel);

// Map "debug" / "info" / "warning" / "critical" (case-insensitive) to a Qt message type.
// Returns false and leaves *level untouched for unknown names.
bool parseLevel(const QString &name, QtMsgType *level);

// Severity rank used for filtering: debug < info < warning < critical < fatal.
int severity(QtMsgType type);

// One log line without the trailing newline, e.g. "[12:00:01.042][warning][onchain.net] timeout".
QString formatLine(QtMsgType type, const char *category, const QString &message);
} // namespace LogHandler

#endif // LOG_HANDLER_H
