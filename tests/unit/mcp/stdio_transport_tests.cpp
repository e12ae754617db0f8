#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <QSignalSpy>
#include <QTest>

#include <csignal>
#include <unistd.h>

#include "common/TestUtils.h"
#include "service/transport/stdio_transport.h"

using onchain::test::ensureQtApp;

namespace
{
struct Pipe
{
    int fds[2] = {-1, -1};

    Pipe() { REQUIRE(::pipe(fds) == 0); }
    ~Pipe()
    {
        closeRead();
        closeWrite();
    }
    int readEnd() const { return fds[0]; }
    int writeEnd() const { return fds[1]; }
    void closeRead()
    {
        if (fds[0] >= 0) ::close(fds[0]);
        fds[0] = -1;
    }
    void closeWrite()
    {
        if (fds[1] >= 0) ::close(fds[1]);
        fds[1] = -1;
    }
    void write(const QByteArray &data) const
    {
        REQUIRE(::write(fds[1], data.constData(), static_cast<size_t>(data.size())) == data.size());
    }
};

QByteArray readAvailable(int fd, int size)
{
    QByteArray buffer(size, '\0');
    const ssize_t n = ::read(fd, buffer.data(), static_cast<size_t>(size));
    return n > 0 ? buffer.left(static_cast<int>(n)) : QByteArray();
}
} // namespace

TEST_CASE("lines are split on newlines and blank lines are skipped")
{
    ensureQtApp();
    Pipe input;
    Pipe output;
    StdioTransport transport(input.readEnd(), output.writeEnd());
    QSignalSpy lines(&transport, &StdioTransport::lineReceived);
    transport.start();
    CHECK(transport.isOpen());

    input.write(QByteArrayLiteral("{\"a\":1}\n\n   \n{\"b\""));
    REQUIRE(QTest::qWaitFor([&]() { return lines.count() == 1; }, 5000));
    CHECK(lines.at(0).at(0).toByteArray() == QByteArrayLiteral("{\"a\":1}"));

    input.write(QByteArrayLiteral(":2}\n"));
    REQUIRE(QTest::qWaitFor([&]() { return lines.count() == 2; }, 5000));
    CHECK(lines.at(1).at(0).toByteArray() == QByteArrayLiteral("{\"b\":2}"));
}

TEST_CASE("end of input flushes a trailing line and emits inputClosed")
{
    ensureQtApp();
    Pipe input;
    Pipe output;
    StdioTransport transport(input.readEnd(), output.writeEnd());
    QSignalSpy lines(&transport, &StdioTransport::lineReceived);
    QSignalSpy closed(&transport, &StdioTransport::inputClosed);
    transport.start();

    input.write(QByteArrayLiteral("{\"last\":true}"));
    input.closeWrite();
    REQUIRE(QTest::qWaitFor([&]() { return closed.count() == 1; }, 5000));
    REQUIRE(lines.count() == 1);
    CHECK(lines.at(0).at(0).toByteArray() == QByteArrayLiteral("{\"last\":true}"));
    CHECK_FALSE(transport.isOpen());
}

TEST_CASE("send writes one line per message")
{
    ensureQtApp();
    Pipe input;
    Pipe output;
    StdioTransport transport(input.readEnd(), output.writeEnd());

    CHECK(transport.send(QByteArrayLiteral("{\"id\":1}")));
    CHECK(transport.send(QByteArrayLiteral("{\"id\":2}")));
    CHECK(readAvailable(output.readEnd(), 256) == QByteArrayLiteral("{\"id\":1}\n{\"id\":2}\n"));
}

TEST_CASE("send reports a closed output")
{
    ensureQtApp();
    Pipe input;
    Pipe output;
    StdioTransport transport(input.readEnd(), output.writeEnd());
    output.closeRead();
    std::signal(SIGPIPE, SIG_IGN);
    CHECK_FALSE(transport.send(QByteArrayLiteral("{}")));
}
