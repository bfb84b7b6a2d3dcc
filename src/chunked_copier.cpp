#include "chunked_copier.h"
#include "file_utils.h"

#include <QObject>
#include <QFile>
#include <QFileInfo>
#include <QByteArray>
#include <QDebug>

#include <algorithm>

namespace {

CopyResult failure(TransferError error, const QString& message, qint64 bytes = 0)
{
    CopyResult r;
    r.error = error;
    r.message = message;
    r.bytes = bytes;
    return r;
}

CopyResult cancelled(qint64 bytes)
{
    return failure(TransferError::Cancelled, QStringLiteral("Cancelled"), bytes);
}

} // namespace

CopyResult ChunkedCopier::copy(const QString& src, const QString& dst, const CancellationToken& cancel,
                               qint64 chunkSize, const ChunkCallback& onChunk)
{
    if (cancel.isCancelled()) return cancelled(0);

    QFile in(src);
    if (!in.open(QIODevice::ReadOnly))
        return failure(TransferError::IoFailure, QObject::tr("Failed to open %1: %2").arg(src, in.errorString()));

    // Truncating the destination would empty the file being read
    if (QFileInfo(src).canonicalFilePath() == QFileInfo(dst).canonicalFilePath())
        return failure(TransferError::IoFailure, QObject::tr("Cannot copy %1 onto itself").arg(src));

    QString dirError;
    if (!FileUtils::ensureParentDir(dst, &dirError))
        return failure(TransferError::IoFailure, dirError);

    QFile out(dst);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return failure(TransferError::IoFailure, QObject::tr("Failed to write %1: %2").arg(dst, out.errorString()));

    // Stop, close both handles, drop the partial destination
    auto discard = [&](CopyResult r) {
        in.close();
        out.close();
        if (!out.remove()) {
            qWarning() << "[Copier] Could not remove partial file" << dst << out.errorString();
            r.message += QObject::tr(" (partial file %1 could not be removed)").arg(dst);
        }
        return r;
    };

    QByteArray buf;
    buf.resize(int(std::max<qint64>(1, chunkSize)));
    qint64 copied = 0;
    for (;;) {
        if (cancel.isCancelled()) return discard(cancelled(copied));
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0)
            return discard(failure(TransferError::IoFailure, QObject::tr("Read error %1: %2").arg(src, in.errorString()), copied));
        if (r == 0) break;
        if (cancel.isCancelled()) return discard(cancelled(copied));
        const qint64 w = out.write(buf.constData(), r);
        if (w != r)
            return discard(failure(TransferError::IoFailure, QObject::tr("Write error %1: %2").arg(dst, out.errorString()), copied));
        copied += w;
        if (onChunk) onChunk(w);
        if (cancel.isCancelled()) return discard(cancelled(copied));
    }

    if (!out.flush())
        return discard(failure(TransferError::IoFailure, QObject::tr("Flush error %1: %2").arg(dst, out.errorString()), copied));
    out.close();
    in.close();
    if (out.error() != QFileDevice::NoError)
        return discard(failure(TransferError::IoFailure, QObject::tr("Close error %1: %2").arg(dst, out.errorString()), copied));

    CopyResult ok;
    ok.bytes = copied;
    return ok;
}

CopyResult ChunkedCopier::copyRange(const QString& src, const QString& dst, qint64 offset, qint64 length,
                                    const CancellationToken& cancel, qint64 chunkSize,
                                    const ChunkCallback& onChunk)
{
    if (cancel.isCancelled()) return cancelled(0);

    QFile in(src);
    if (!in.open(QIODevice::ReadOnly))
        return failure(TransferError::IoFailure, QObject::tr("Failed to open %1: %2").arg(src, in.errorString()));
    // ReadWrite keeps the pre-sized contents; WriteOnly would truncate
    QFile out(dst);
    if (!out.open(QIODevice::ReadWrite))
        return failure(TransferError::IoFailure, QObject::tr("Failed to write %1: %2").arg(dst, out.errorString()));
    if (!in.seek(offset) || !out.seek(offset))
        return failure(TransferError::IoFailure, QObject::tr("Seek to %1 failed for %2").arg(offset).arg(src));

    QByteArray buf;
    buf.resize(int(std::max<qint64>(1, std::min(chunkSize, length))));
    qint64 copied = 0;
    while (copied < length) {
        if (cancel.isCancelled()) return cancelled(copied);
        const qint64 want = std::min<qint64>(buf.size(), length - copied);
        const qint64 r = in.read(buf.data(), want);
        if (r < 0)
            return failure(TransferError::IoFailure, QObject::tr("Read error %1: %2").arg(src, in.errorString()), copied);
        if (r == 0)
            return failure(TransferError::IoFailure,
                           QObject::tr("Unexpected end of %1 at offset %2").arg(src).arg(offset + copied), copied);
        if (cancel.isCancelled()) return cancelled(copied);
        const qint64 w = out.write(buf.constData(), r);
        if (w != r)
            return failure(TransferError::IoFailure, QObject::tr("Write error %1: %2").arg(dst, out.errorString()), copied);
        copied += w;
        if (onChunk) onChunk(w);
        if (cancel.isCancelled()) return cancelled(copied);
    }

    if (!out.flush())
        return failure(TransferError::IoFailure, QObject::tr("Flush error %1: %2").arg(dst, out.errorString()), copied);

    CopyResult ok;
    ok.bytes = copied;
    return ok;
}
