#ifndef STDIO_TRANSPORT_H
#define STDIO_TRANSPORT_H

#include <QByteArray>
#include <QMutex>
#include <QObject>

class QSocketNotifier;

// 换行分隔的 stdio 通道：从 inFd 读取并按行发出 lineReceived，send() 写入 outFd 并追加换行
// 仅支持 POSIX 文件描述符；测试中可传入 pipe()
class StdioTransport : public QObject
{
    Q_OBJECT
  public:
    explicit StdioTransport(int inFd = 0, int outFd = 1, QObject *parent = nullptr);
    ~StdioTransport() override;

    void start();
    bool isOpen() const { return open_; }

  public slots:
    bool send(const QByteArray &line);

  signals:
    void lineReceived(const QByteArray &line);
    void inputClosed();

  private slots:
    void handleReadable();

  private:
    void processBuffer();
    void closeInput();

    int inFd_;
    int outFd_;
    QSocketNotifier *notifier_ = nullptr;
    QByteArray buffer_;
    QMutex writeMutex_;
    bool open_ = false;
};

#endif // STDIO_TRANSPORT_H
