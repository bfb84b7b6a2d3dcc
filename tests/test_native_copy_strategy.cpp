#include <QtTest>
#include <QtConcurrent>
#include <QTemporaryDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include "../src/native_copy_strategy.h"

namespace {

bool writeFile(const QString& path, const QByteArray& data)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return false;
    return f.write(data) == data.size();
}

// Executable shell script standing in for the bulk-copy tool
QString writeScript(const QTemporaryDir& dir, const QString& name, const QByteArray& body)
{
    const QString path = dir.filePath(name);
    if (!writeFile(path, "#!/bin/sh\n" + body + "\n")) return QString();
    QFile::setPermissions(path, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    return path;
}

} // namespace

class TestNativeCopyStrategy : public QObject {
    Q_OBJECT
private slots:
    void testMissingToolIsUnavailable();
    void testCancelledBeforeStart();
    void testCpCopiesFile();
    void testCpFailureIsReported();
    void testRobocopyArguments();
    void testRobocopyCannotRename();
    void testRobocopyExitCodes();
    void testCancelKillsRunningTool();
};

void TestNativeCopyStrategy::testMissingToolIsUnavailable()
{
    QTemporaryDir dir;
    QVERIFY(writeFile(dir.filePath("a"), "abc"));
    NativeCopyStrategy native("ktransfer-no-such-tool");
    QVERIFY(!native.isAvailable());
    QVERIFY(native.resolvedTool().isEmpty());
    CopyResult r = native.tryNativeCopy(dir.filePath("a"), dir.filePath("b"), CancellationToken());
    QCOMPARE(r.error, TransferError::NativeToolUnavailable);
    QVERIFY(!QFileInfo::exists(dir.filePath("b")));
}

void TestNativeCopyStrategy::testCancelledBeforeStart()
{
    QTemporaryDir dir;
    QVERIFY(writeFile(dir.filePath("a"), "abc"));
    NativeCopyStrategy native;
    CancellationToken token;
    token.cancel();
    CopyResult r = native.tryNativeCopy(dir.filePath("a"), dir.filePath("b"), token);
    QCOMPARE(r.error, TransferError::Cancelled);
    QVERIFY(!QFileInfo::exists(dir.filePath("b")));
}

void TestNativeCopyStrategy::testCpCopiesFile()
{
#ifdef Q_OS_WIN
    QSKIP("cp flavor is not used on Windows");
#else
    NativeCopyStrategy native("cp");
    if (!native.isAvailable()) QSKIP("cp not found on PATH");
    QCOMPARE(native.flavor(), NativeCopyStrategy::Flavor::Cp);
    QCOMPARE(QFileInfo(native.resolvedTool()).fileName(), QString("cp"));

    QTemporaryDir dir;
    const QByteArray data(70000, 'k');
    QVERIFY(writeFile(dir.filePath("plate.exr"), data));
    const QString dst = dir.filePath("out/renamed.exr");
    CopyResult r = native.tryNativeCopy(dir.filePath("plate.exr"), dst, CancellationToken());
    QVERIFY2(r.ok(), qPrintable(r.message));
    QCOMPARE(r.bytes, qint64(data.size()));
    QCOMPARE(QFileInfo(dst).size(), qint64(data.size()));
#endif
}

void TestNativeCopyStrategy::testCpFailureIsReported()
{
#ifdef Q_OS_WIN
    QSKIP("cp flavor is not used on Windows");
#else
    NativeCopyStrategy native("cp");
    if (!native.isAvailable()) QSKIP("cp not found on PATH");
    QTemporaryDir dir;
    CopyResult r = native.tryNativeCopy(dir.filePath("missing"), dir.filePath("b"), CancellationToken());
    QCOMPARE(r.error, TransferError::NativeToolFailure);
    QVERIFY(r.message.contains("exited with code"));
    QVERIFY(!QFileInfo::exists(dir.filePath("b")));
#endif
}

void TestNativeCopyStrategy::testRobocopyArguments()
{
#ifdef Q_OS_WIN
    QSKIP("needs a shell script standing in for robocopy");
#else
    QTemporaryDir dir;
    const QString tool = writeScript(dir, "robocopy", "exit 0");
    NativeCopyStrategy native(tool, 16);
    QVERIFY(native.isAvailable());
    QCOMPARE(native.flavor(), NativeCopyStrategy::Flavor::Robocopy);

    const QStringList args = native.buildArguments("/data/in/a.exr", "/data/out/a.exr");
    QCOMPARE(args.value(2), QString("a.exr"));
    QVERIFY(args.contains("/J"));
    QVERIFY(args.contains("/MT:16"));
    QVERIFY(args.contains("/R:0"));
    QVERIFY(args.contains("/IS"));
#endif
}

void TestNativeCopyStrategy::testRobocopyCannotRename()
{
#ifdef Q_OS_WIN
    QSKIP("needs a shell script standing in for robocopy");
#else
    QTemporaryDir dir;
    const QString tool = writeScript(dir, "robocopy", "exit 0");
    NativeCopyStrategy native(tool);
    QVERIFY(native.buildArguments("/in/a.exr", "/out/b.exr").isEmpty());

    QVERIFY(writeFile(dir.filePath("a.exr"), "x"));
    CopyResult r = native.tryNativeCopy(dir.filePath("a.exr"), dir.filePath("b.exr"), CancellationToken());
    QCOMPARE(r.error, TransferError::NativeToolUnavailable);
#endif
}

void TestNativeCopyStrategy::testRobocopyExitCodes()
{
#ifdef Q_OS_WIN
    QSKIP("needs a shell script standing in for robocopy");
#else
    QTemporaryDir dir;
    QVERIFY(QDir().mkpath(dir.filePath("src")));
    QVERIFY(writeFile(dir.filePath("src/a.exr"), "x"));

    // Exit code 1 is a success variant, but nothing was written
    QTemporaryDir toolDir;
    NativeCopyStrategy quiet(writeScript(toolDir, "robocopy", "exit 1"));
    CopyResult r = quiet.tryNativeCopy(dir.filePath("src/a.exr"), dir.filePath("dst/a.exr"), CancellationToken());
    QCOMPARE(r.error, TransferError::NativeToolFailure);
    QVERIFY(r.message.contains("missing"));

    QTemporaryDir toolDir2;
    NativeCopyStrategy broken(writeScript(toolDir2, "robocopy", "exit 8"));
    r = broken.tryNativeCopy(dir.filePath("src/a.exr"), dir.filePath("dst/a.exr"), CancellationToken());
    QCOMPARE(r.error, TransferError::NativeToolFailure);
    QVERIFY(r.message.contains("code 8"));
#endif
}

void TestNativeCopyStrategy::testCancelKillsRunningTool()
{
#ifdef Q_OS_WIN
    QSKIP("needs a shell script standing in for the tool");
#else
    QTemporaryDir dir;
    // Leaves a partial destination behind, then hangs
    const QString tool = writeScript(dir, "slowcp", "for a in \"$@\"; do last=\"$a\"; done\necho partial > \"$last\"\nexec sleep 30");
    NativeCopyStrategy native(tool);
    native.setPollInterval(20);
    QCOMPARE(native.flavor(), NativeCopyStrategy::Flavor::Cp);
    QVERIFY(writeFile(dir.filePath("a"), "abc"));

    CancellationToken token;
    QFuture<void> canceller = QtConcurrent::run([token]() mutable {
        QThread::msleep(200);
        token.cancel();
    });

    QElapsedTimer timer;
    timer.start();
    CopyResult r = native.tryNativeCopy(dir.filePath("a"), dir.filePath("out/b"), token);
    canceller.waitForFinished();
    QCOMPARE(r.error, TransferError::Cancelled);
    QVERIFY(timer.elapsed() < 10000);
    QVERIFY(!QFileInfo::exists(dir.filePath("out/b")));
#endif
}

QTEST_APPLESS_MAIN(TestNativeCopyStrategy)
#include "test_native_copy_strategy.moc"
