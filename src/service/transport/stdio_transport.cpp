#include "service/transport/stdio_transport.h"

#include "utils/log_categories.h"

#include <QMutexLocker>
#include <QSocketNotifier>

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace
{
constexpr int kReadChunk = 64 * 1024;
}

StdioTransport::StdioTransport(int inFd, int outFd, QObject *parent)
    : QObject(parent), inFd_(inFd), outFd_(outFd)
{
}

StdioTransport::~StdioTransport() = default;

void StdioTransport::start()
{
    if (open_ || notifier_) return;
    open_ = true;
    notifier_ = new QSocketNotifier(inFd_, QSocketNotifier::Read, this);
    // Qt 5.15 起 activated 有两个重载，这里用字符串连接
    connect(notifier_, SIGNAL(activated(int)), this, SLOT(handleReadable()));
    notifier_->setEnabled(true);
}

void StdioTransport::handleReadable()
{
    if (!open_) return;
    char chunk[kReadChunk];
    ssize_t n = 0;
    do
    {
        n = ::read(inFd_, chunk, sizeof(chunk));
    } while (n < 0 && errno == EINTR);

    if (n > 0)
    {
        buffer_.append(chunk, static_cast<int>(n));
        processBuffer();
        return;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
    if (n < 0) qCWarning(lcMcp) << "stdin read failed:" << std::strerror(errno);
    closeInput();
}

void StdioTransport::processBuffer()
{
    int newlineIndex = -1;
    while ((newlineIndex = buffer_.indexOf('\n')) != -1)
    {
        QByteArray line = buffer_.left(newlineIndex);
        buffer_.remove(0, newlineIndex + 1);
        if (line.trimmed().isEmpty()) continue;
        emit lineReceived(line);
    }
}

void StdioTransport::closeInput()
{
    open_ = false;
    if (notifier_) notifier_->setEnabled(false);
    // 最后一行可能没有换行符
    if (!buffer_.trimmed().isEmpty()) emit lineReceived(buffer_);
    buffer_.clear();
    qCDebug(lcMcp) << "stdin closed";
    emit inputClosed();
}

bool StdioTransport::send(const QByteArray &line)
{
    QByteArray payload = line;
    payload.append('\n');

    QMutexLocker locker(&writeMutex_);
    const char *data = payload.constData();
    qsizetype remaining = payload.size();
    while (remaining > 0)
    {
        const ssize_t written = ::write(outFd_, data, static_cast<size_t>(remaining));
        if (written < 0)
        {
            if (errno == EINTR) continue;
            qCCritical(lcMcp) << "stdout write failed:" << std::strerror(errno);
            return false;
        }
        data += written;
        remaining -= written;
    }
    return true;
}
