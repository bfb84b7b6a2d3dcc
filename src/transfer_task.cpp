#include "transfer_task.h"
#include "native_copy_strategy.h"
#include "file_utils.h"

#include <QObject>
#include <QtConcurrent>
#include <QThreadPool>
#include <QFile>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QDebug>

#include <algorithm>

namespace {
constexpr qint64 kMinRangeSize = 1024 * 1024;       // 1 MiB
constexpr qint64 kMaxRangeSize = 64 * 1024 * 1024;  // 64 MiB
}

CopyStrategy selectStrategy(OperationType type, qint64 sizeBytes, const TransferSettings& settings,
                            bool nativeAvailable)
{
    if (type == OperationType::Move && settings.renameForMove) return CopyStrategy::Rename;
    if (settings.nativeToolEnabled && nativeAvailable) return CopyStrategy::NativeTool;
    if (settings.maxChunkConcurrency > 1 && sizeBytes > 0 && sizeBytes >= settings.largeFileThreshold)
        return CopyStrategy::ParallelChunks;
    return CopyStrategy::ChunkedCopy;
}

TransferTask::TransferTask(const Operation& op, OperationType type, const TransferSettings& settings,
                           const NativeCopyStrategy* native, QThreadPool* chunkPool)
    : m_op(op)
    , m_type(type)
    , m_settings(settings)
    , m_native(native)
    , m_chunkPool(chunkPool)
    , m_throttle(settings.progressIntervalMs, settings.progressByteStep)
{
    m_totalBytes.store(std::max<qint64>(0, op.sizeBytes));
}

TransferSnapshot TransferTask::snapshot() const
{
    TransferSnapshot s;
    s.operationId = m_op.id;
    s.status = TransferStatus(m_status.load());
    s.bytesCopied = m_bytesCopied.load();
    s.totalBytes = m_totalBytes.load();
    const qint64 started = m_startedAtMs.load();
    if (started > 0) s.startedAt = QDateTime::fromMSecsSinceEpoch(started);
    return s;
}

void TransferTask::report(qint64 deltaBytes, bool force)
{
    m_bytesCopied.fetch_add(deltaBytes);
    QMutexLocker lk(&m_progressMutex);
    m_pendingBytes += deltaBytes;
    if (!m_onProgress) return;
    if (!force && !m_throttle.shouldEmit(m_pendingBytes)) return;
    TransferProgress p;
    p.operationId = m_op.id;
    p.currentFile = m_op.sourcePath;
    p.bytesCopied = m_bytesCopied.load();
    p.totalBytes = m_totalBytes.load();
    p.deltaBytes = m_pendingBytes;
    m_reportedBytes += m_pendingBytes;
    m_pendingBytes = 0;
    lk.unlock();
    m_onProgress(p);
}

// Withdraws everything this task reported so aggregate byte counts only
// include data that stayed on disk
void TransferTask::rollbackProgress()
{
    QMutexLocker lk(&m_progressMutex);
    const qint64 reported = m_reportedBytes;
    m_reportedBytes = 0;
    m_pendingBytes = 0;
    m_bytesCopied.store(0);
    if (!m_onProgress || reported == 0) return;
    TransferProgress p;
    p.operationId = m_op.id;
    p.currentFile = m_op.sourcePath;
    p.bytesCopied = 0;
    p.totalBytes = m_totalBytes.load();
    p.deltaBytes = -reported;
    lk.unlock();
    m_onProgress(p);
}

TransferResult TransferTask::finish(TransferResult r, TransferStatus status)
{
    r.operationId = m_op.id;
    m_status.store(int(status));
    if (status == TransferStatus::Error)
        qWarning() << "[Task]" << m_op.id << toString(r.error) << r.errorMessage;
    else if (status == TransferStatus::Cancelled)
        qDebug() << "[Task]" << m_op.id << "cancelled";
    else if (status == TransferStatus::Done)
        qDebug() << "[Task]" << m_op.id << "done via" << toString(r.strategy) << r.bytes << "bytes";
    return r;
}

bool TransferTask::tryRename(QString* errorOut)
{
    if (QFileInfo::exists(m_op.destinationPath) && !QFile::remove(m_op.destinationPath)) {
        if (errorOut) *errorOut = QObject::tr("Cannot replace existing %1").arg(m_op.destinationPath);
        return false;
    }
    // QDir::rename never falls back to copying, unlike QFile::rename
    if (!QDir().rename(m_op.sourcePath, m_op.destinationPath)) {
        if (errorOut) *errorOut = QObject::tr("Rename %1 -> %2 not possible").arg(m_op.sourcePath, m_op.destinationPath);
        return false;
    }
    return true;
}

CopyResult TransferTask::copyParallel(const CancellationToken& cancel, qint64 size)
{
    const int maxStreams = std::max(1, m_settings.maxChunkConcurrency);
    const qint64 rangeSize = std::clamp<qint64>(size / maxStreams, kMinRangeSize, kMaxRangeSize);
    const int numRanges = int((size + rangeSize - 1) / rangeSize);
    const int streams = std::min(maxStreams, numRanges);

    {
        QFile out(m_op.destinationPath);
        if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate) || !out.resize(size)) {
            qInfo() << "[Task] Destination cannot be pre-sized, using a single stream for" << m_op.destinationPath;
            out.close();
            return ChunkedCopier::copy(m_op.sourcePath, m_op.destinationPath, cancel, m_settings.chunkSize,
                                       [this](qint64 n) { report(n, false); });
        }
    }

    qDebug() << "[Task]" << m_op.id << "parallel copy:" << size << "bytes," << numRanges
             << "ranges of" << rangeSize << "on" << streams << "streams";

    // Cancelled by a failing stream so its siblings stop early
    CancellationToken streamAbort = cancel.linked();
    std::atomic<int> nextRange{0};

    QThreadPool localPool;
    QThreadPool* pool = m_chunkPool;
    if (!pool) {
        localPool.setMaxThreadCount(streams);
        pool = &localPool;
    }

    QVector<QFuture<CopyResult>> futures;
    futures.reserve(streams);
    for (int i = 0; i < streams; ++i) {
        futures.push_back(QtConcurrent::run(pool, [this, &streamAbort, &nextRange, numRanges, rangeSize, size]() {
            CopyResult total;
            for (;;) {
                const int idx = nextRange.fetch_add(1);
                if (idx >= numRanges) break;
                const qint64 offset = qint64(idx) * rangeSize;
                const qint64 length = std::min(rangeSize, size - offset);
                CopyResult r = ChunkedCopier::copyRange(m_op.sourcePath, m_op.destinationPath, offset, length,
                                                        streamAbort, m_settings.chunkSize,
                                                        [this](qint64 n) { report(n, false); });
                total.bytes += r.bytes;
                if (!r.ok()) {
                    streamAbort.cancel();
                    r.bytes = total.bytes;
                    return r;
                }
            }
            return total;
        }));
    }

    CopyResult combined;
    for (auto& f : futures) {
        f.waitForFinished();
        const CopyResult r = f.result();
        combined.bytes += r.bytes;
        if (r.ok()) continue;
        // A real I/O error outranks the Cancelled its siblings report afterwards
        if (combined.ok() || (combined.error == TransferError::Cancelled && r.error != TransferError::Cancelled)) {
            combined.error = r.error;
            combined.message = r.message;
        }
    }

    if (!combined.ok() && !FileUtils::removePartial(m_op.destinationPath)) {
        qWarning() << "[Task] Could not remove partial file" << m_op.destinationPath;
        combined.message += QObject::tr(" (partial file %1 could not be removed)").arg(m_op.destinationPath);
    }
    return combined;
}

TransferResult TransferTask::execute(const CancellationToken& cancel, const ProgressCallback& onProgress)
{
    TransferResult result;
    result.operationId = m_op.id;

    // Already cancelled: leave the filesystem untouched
    if (cancel.isCancelled()) {
        result.error = TransferError::Cancelled;
        result.errorMessage = QObject::tr("Cancelled before start");
        return finish(result, TransferStatus::Cancelled);
    }

    m_onProgress = onProgress;
    m_startedAtMs.store(QDateTime::currentMSecsSinceEpoch());
    m_status.store(int(TransferStatus::Copying));

    const qint64 srcSize = FileUtils::fileSize(m_op.sourcePath);
    if (srcSize < 0) {
        result.error = TransferError::IoFailure;
        result.errorMessage = QObject::tr("Source file not found: %1").arg(m_op.sourcePath);
        return finish(result, TransferStatus::Error);
    }
    m_totalBytes.store(srcSize);

    const QString srcCanonical = QFileInfo(m_op.sourcePath).canonicalFilePath();
    if (srcCanonical == QFileInfo(m_op.destinationPath).canonicalFilePath()) {
        // Moving a file onto itself is already done; copying it onto itself would
        // truncate the only copy
        result.strategy = CopyStrategy::Rename;
        if (m_type == OperationType::Move) {
            report(srcSize, true);
            result.success = true;
            result.bytes = srcSize;
            return finish(result, TransferStatus::Done);
        }
        result.error = TransferError::IoFailure;
        result.errorMessage = QObject::tr("Source and destination are the same file: %1").arg(m_op.sourcePath);
        return finish(result, TransferStatus::Error);
    }

    QString dirError;
    if (!FileUtils::ensureParentDir(m_op.destinationPath, &dirError)) {
        result.error = TransferError::IoFailure;
        result.errorMessage = dirError;
        return finish(result, TransferStatus::Error);
    }

    const bool nativeAvailable = m_native && m_native->isAvailable();
    CopyStrategy strategy = selectStrategy(m_type, srcSize, m_settings, nativeAvailable);

    if (strategy == CopyStrategy::Rename) {
        QString renameError;
        // A rename moves the file whole; there is nothing left to verify
        if (tryRename(&renameError)) {
            report(srcSize, true);
            result.success = true;
            result.bytes = srcSize;
            result.strategy = CopyStrategy::Rename;
            return finish(result, TransferStatus::Done);
        }
        qDebug() << "[Task]" << renameError << "- falling back to copy + delete";
        strategy = selectStrategy(OperationType::Copy, srcSize, m_settings, nativeAvailable);
    }

    CopyResult copied;
    bool haveCopy = false;
    if (strategy == CopyStrategy::NativeTool) {
        copied = m_native->tryNativeCopy(m_op.sourcePath, m_op.destinationPath, cancel);
        if (copied.ok()) {
            report(copied.bytes, true);
            haveCopy = true;
        } else if (copied.error == TransferError::Cancelled) {
            haveCopy = true;
        } else {
            qInfo() << "[Task] Native copy unavailable for" << m_op.id << "(" << copied.message << "), using chunked copy";
            strategy = selectStrategy(OperationType::Copy, srcSize, m_settings, false);
        }
    }

    if (!haveCopy) {
        if (strategy == CopyStrategy::ParallelChunks) {
            copied = copyParallel(cancel, srcSize);
        } else {
            copied = ChunkedCopier::copy(m_op.sourcePath, m_op.destinationPath, cancel, m_settings.chunkSize,
                                         [this](qint64 n) { report(n, false); });
        }
    }
    result.strategy = strategy;

    if (!copied.ok()) {
        rollbackProgress();
        result.error = copied.error == TransferError::Cancelled ? TransferError::Cancelled : TransferError::IoFailure;
        result.errorMessage = copied.message;
        return finish(result, copied.error == TransferError::Cancelled ? TransferStatus::Cancelled : TransferStatus::Error);
    }

    m_status.store(int(TransferStatus::Verifying));
    const qint64 dstSize = FileUtils::fileSize(m_op.destinationPath);
    if (dstSize != srcSize) {
        rollbackProgress();
        if (!FileUtils::removePartial(m_op.destinationPath))
            qWarning() << "[Task] Could not remove unverified file" << m_op.destinationPath;
        result.error = TransferError::VerificationFailure;
        result.errorMessage = QObject::tr("Size mismatch for %1: expected %2, got %3")
                                  .arg(m_op.destinationPath).arg(srcSize).arg(dstSize);
        return finish(result, TransferStatus::Error);
    }

    if (m_type == OperationType::Move) {
        // Never delete the source of a cancelled move, even when the copy landed
        if (cancel.isCancelled()) {
            rollbackProgress();
            if (!FileUtils::removePartial(m_op.destinationPath))
                qWarning() << "[Task] Could not remove destination of cancelled move" << m_op.destinationPath;
            result.error = TransferError::Cancelled;
            result.errorMessage = QObject::tr("Cancelled before source deletion");
            return finish(result, TransferStatus::Cancelled);
        }
        QFile srcFile(m_op.sourcePath);
        if (!srcFile.remove()) {
            result.warning = TransferError::SourceDeleteFailure;
            result.warningMessage = QObject::tr("Copied, but could not delete source %1: %2")
                                        .arg(m_op.sourcePath, srcFile.errorString());
            qWarning() << "[Task]" << result.warningMessage;
        }
    }

    report(0, true);
    result.success = true;
    result.bytes = srcSize;
    return finish(result, TransferStatus::Done);
}
