#include "native_copy_strategy.h"
#include "file_utils.h"

#include <QObject>
#include <QProcess>
#include <QFileInfo>
#include <QDir>
#include <QStandardPaths>
#include <QElapsedTimer>
#include <QDebug>

static CopyResult nativeFailure(TransferError error, const QString& message)
{
    CopyResult r;
    r.error = error;
    r.message = message;
    return r;
}

QString NativeCopyStrategy::defaultToolName()
{
#ifdef Q_OS_WIN
    return QStringLiteral("robocopy");
#else
    return QStringLiteral("cp");
#endif
}

NativeCopyStrategy::NativeCopyStrategy(const QString& toolPath, int threads)
    : m_threads(threads)
{
    if (toolPath.isEmpty()) {
        m_program = QStandardPaths::findExecutable(defaultToolName());
    } else {
        QFileInfo fi(toolPath);
        if (fi.isAbsolute()) m_program = (fi.exists() && fi.isExecutable()) ? fi.absoluteFilePath() : QString();
        else m_program = QStandardPaths::findExecutable(toolPath);
    }
    const QString base = QFileInfo(m_program).completeBaseName().toLower();
    m_flavor = base == "robocopy" ? Flavor::Robocopy : Flavor::Cp;
}

QStringList NativeCopyStrategy::buildArguments(const QString& src, const QString& dst) const
{
    const QFileInfo sfi(src);
    const QFileInfo dfi(dst);
    if (m_flavor == Flavor::Robocopy) {
        if (sfi.fileName() != dfi.fileName()) return {};
        return {
            QDir::toNativeSeparators(sfi.absolutePath()),
            QDir::toNativeSeparators(dfi.absolutePath()),
            sfi.fileName(),
            "/J",                               // unbuffered I/O
            QString("/MT:%1").arg(m_threads),
            "/NFL", "/NDL", "/NP",              // no listing or progress output
            "/R:0", "/W:1",
            "/BYTES",
            "/IS"                               // overwrite same files
        };
    }
    QStringList args;
#ifdef Q_OS_LINUX
    args << "--reflink=auto";
#endif
    args << "-f" << "--" << sfi.absoluteFilePath() << dfi.absoluteFilePath();
    return args;
}

bool NativeCopyStrategy::isSuccessExitCode(int code) const
{
    // robocopy: 0..7 are success variants, 8+ means at least one failure
    if (m_flavor == Flavor::Robocopy) return code >= 0 && code < 8;
    return code == 0;
}

CopyResult NativeCopyStrategy::tryNativeCopy(const QString& src, const QString& dst, const CancellationToken& cancel) const
{
    if (cancel.isCancelled()) return nativeFailure(TransferError::Cancelled, "Cancelled");
    if (!isAvailable())
        return nativeFailure(TransferError::NativeToolUnavailable, QObject::tr("%1 not found").arg(defaultToolName()));

    const QStringList args = buildArguments(src, dst);
    if (args.isEmpty())
        return nativeFailure(TransferError::NativeToolUnavailable,
                             QObject::tr("%1 cannot rename %2 to %3").arg(QFileInfo(m_program).fileName(),
                                                                       QFileInfo(src).fileName(),
                                                                       QFileInfo(dst).fileName()));

    QString dirError;
    if (!FileUtils::ensureParentDir(dst, &dirError))
        return nativeFailure(TransferError::NativeToolFailure, dirError);

    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start(m_program, args);
    if (!proc.waitForStarted()) {
        return nativeFailure(TransferError::NativeToolUnavailable,
                             QObject::tr("Failed to start %1: %2").arg(m_program, proc.errorString()));
    }

    QElapsedTimer timer;
    timer.start();
    while (!proc.waitForFinished(m_pollIntervalMs)) {
        if (proc.state() == QProcess::NotRunning) break;
        if (cancel.isCancelled()) {
            qInfo() << "[Native] Cancel requested, killing" << QFileInfo(m_program).fileName() << "for" << src;
            proc.kill();
            proc.waitForFinished();
            if (!FileUtils::removePartial(dst))
                qWarning() << "[Native] Could not remove partial file" << dst;
            return nativeFailure(TransferError::Cancelled, "Cancelled");
        }
    }

    const QString output = QString::fromLocal8Bit(proc.readAll()).trimmed();
    if (proc.exitStatus() != QProcess::NormalExit || !isSuccessExitCode(proc.exitCode())) {
        qWarning() << "[Native]" << QFileInfo(m_program).fileName() << "exit" << proc.exitCode() << "for" << src << output;
        if (!FileUtils::removePartial(dst))
            qWarning() << "[Native] Could not remove partial file" << dst;
        return nativeFailure(TransferError::NativeToolFailure,
                             QObject::tr("%1 exited with code %2%3").arg(QFileInfo(m_program).fileName())
                                 .arg(proc.exitCode())
                                 .arg(output.isEmpty() ? QString() : QString(": ") + output.left(300)));
    }

    CopyResult ok;
    ok.bytes = FileUtils::fileSize(dst);
    if (ok.bytes < 0) {
        return nativeFailure(TransferError::NativeToolFailure,
                             QObject::tr("%1 reported success but %2 is missing").arg(QFileInfo(m_program).fileName(), dst));
    }
    const qint64 ms = timer.elapsed();
    qDebug() << "[Native] Copied" << src << ok.bytes << "bytes in" << ms << "ms";
    return ok;
}
