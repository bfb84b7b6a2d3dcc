#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QFileInfo>
#include "../src/chunked_copier.h"

namespace {

QByteArray pattern(int size)
{
    QByteArray data(size, '\0');
    for (int i = 0; i < size; ++i) data[i] = char((i * 31 + 7) & 0xff);
    return data;
}

bool writeFile(const QString& path, const QByteArray& data)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return false;
    return f.write(data) == data.size();
}

QByteArray readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

} // namespace

class TestChunkedCopier : public QObject {
    Q_OBJECT
private slots:
    void testCopiesAllBytes();
    void testEmptyFile();
    void testCreatesDestinationDirectory();
    void testOverwritesExistingDestination();
    void testCancelMidCopyRemovesPartial();
    void testCancelledBeforeStartCreatesNothing();
    void testMissingSource();
    void testCopyOntoItselfKeepsFile();
    void testCopyRange();
    void testCopyRangePastEndFails();
};

void TestChunkedCopier::testCopiesAllBytes()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QByteArray data = pattern(100 * 1024 + 17);
    const QString src = dir.filePath("src.bin");
    const QString dst = dir.filePath("dst.bin");
    QVERIFY(writeFile(src, data));

    int chunks = 0;
    qint64 reported = 0;
    CopyResult r = ChunkedCopier::copy(src, dst, CancellationToken(), 16 * 1024,
                                       [&](qint64 n) { ++chunks; reported += n; });
    QVERIFY(r.ok());
    QCOMPARE(r.bytes, qint64(data.size()));
    QCOMPARE(reported, qint64(data.size()));
    QCOMPARE(chunks, 7);
    QCOMPARE(readFile(dst), data);
}

void TestChunkedCopier::testEmptyFile()
{
    QTemporaryDir dir;
    const QString src = dir.filePath("empty");
    QVERIFY(writeFile(src, QByteArray()));
    CopyResult r = ChunkedCopier::copy(src, dir.filePath("out"), CancellationToken(), 4096);
    QVERIFY(r.ok());
    QCOMPARE(r.bytes, qint64(0));
    QVERIFY(QFileInfo::exists(dir.filePath("out")));
}

void TestChunkedCopier::testCreatesDestinationDirectory()
{
    QTemporaryDir dir;
    const QString src = dir.filePath("a.bin");
    QVERIFY(writeFile(src, pattern(5000)));
    const QString dst = dir.filePath("x/y/z/a.bin");
    QVERIFY(ChunkedCopier::copy(src, dst, CancellationToken(), 4096).ok());
    QCOMPARE(QFileInfo(dst).size(), qint64(5000));
}

void TestChunkedCopier::testOverwritesExistingDestination()
{
    QTemporaryDir dir;
    const QString src = dir.filePath("a.bin");
    const QString dst = dir.filePath("b.bin");
    QVERIFY(writeFile(src, pattern(1000)));
    QVERIFY(writeFile(dst, pattern(9000)));
    QVERIFY(ChunkedCopier::copy(src, dst, CancellationToken(), 4096).ok());
    QCOMPARE(readFile(dst), pattern(1000));
}

void TestChunkedCopier::testCancelMidCopyRemovesPartial()
{
    QTemporaryDir dir;
    const QString src = dir.filePath("big.bin");
    const QString dst = dir.filePath("big.copy");
    QVERIFY(writeFile(src, pattern(64 * 1024)));

    CancellationToken token;
    int chunks = 0;
    CopyResult r = ChunkedCopier::copy(src, dst, token, 4096, [&](qint64) {
        if (++chunks == 3) token.cancel();
    });
    QCOMPARE(r.error, TransferError::Cancelled);
    // The copy stops at the chunk boundary right after the cancel
    QCOMPARE(chunks, 3);
    QCOMPARE(r.bytes, qint64(3 * 4096));
    QVERIFY(!QFileInfo::exists(dst));
    QVERIFY(QFileInfo::exists(src));
}

void TestChunkedCopier::testCancelledBeforeStartCreatesNothing()
{
    QTemporaryDir dir;
    const QString src = dir.filePath("a.bin");
    QVERIFY(writeFile(src, pattern(100)));
    CancellationToken token;
    token.cancel();
    CopyResult r = ChunkedCopier::copy(src, dir.filePath("sub/a.bin"), token, 4096);
    QCOMPARE(r.error, TransferError::Cancelled);
    QVERIFY(!QFileInfo::exists(dir.filePath("sub")));
}

void TestChunkedCopier::testMissingSource()
{
    QTemporaryDir dir;
    CopyResult r = ChunkedCopier::copy(dir.filePath("nope"), dir.filePath("out"), CancellationToken(), 4096);
    QCOMPARE(r.error, TransferError::IoFailure);
    QVERIFY(!r.message.isEmpty());
    QVERIFY(!QFileInfo::exists(dir.filePath("out")));
}

void TestChunkedCopier::testCopyOntoItselfKeepsFile()
{
    QTemporaryDir dir;
    const QByteArray data = pattern(10000);
    const QString src = dir.filePath("a.bin");
    QVERIFY(writeFile(src, data));

    // Same file spelled through a redundant path segment
    CopyResult r = ChunkedCopier::copy(src, dir.filePath("./a.bin"), CancellationToken(), 4096);
    QCOMPARE(r.error, TransferError::IoFailure);
    QVERIFY(r.message.contains("onto itself"));
    QCOMPARE(readFile(src), data);
}

void TestChunkedCopier::testCopyRange()
{
    QTemporaryDir dir;
    const QByteArray data = pattern(30000);
    const QString src = dir.filePath("src");
    const QString dst = dir.filePath("dst");
    QVERIFY(writeFile(src, data));
    {
        QFile out(dst);
        QVERIFY(out.open(QIODevice::WriteOnly));
        QVERIFY(out.resize(data.size()));
    }

    // Ranges written out of order still assemble the whole file
    QVERIFY(ChunkedCopier::copyRange(src, dst, 20000, 10000, CancellationToken(), 4096).ok());
    QVERIFY(ChunkedCopier::copyRange(src, dst, 0, 10000, CancellationToken(), 4096).ok());
    QVERIFY(ChunkedCopier::copyRange(src, dst, 10000, 10000, CancellationToken(), 4096).ok());
    QCOMPARE(readFile(dst), data);
}

void TestChunkedCopier::testCopyRangePastEndFails()
{
    QTemporaryDir dir;
    const QString src = dir.filePath("src");
    const QString dst = dir.filePath("dst");
    QVERIFY(writeFile(src, pattern(1000)));
    QVERIFY(writeFile(dst, QByteArray(2000, '\0')));
    CopyResult r = ChunkedCopier::copyRange(src, dst, 500, 1000, CancellationToken(), 256);
    QCOMPARE(r.error, TransferError::IoFailure);
    QCOMPARE(r.bytes, qint64(500));
    // Shared destination is left for the caller to clean up
    QVERIFY(QFileInfo::exists(dst));
}

QTEST_APPLESS_MAIN(TestChunkedCopier)
#include "test_chunked_copier.moc"
