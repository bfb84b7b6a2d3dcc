#pragma once
#include <QString>
#include <QDateTime>
#include <QMutex>
#include <atomic>
#include <functional>

#include "cancellation_registry.h"
#include "chunked_copier.h"
#include "progress_throttle.h"
#include "transfer_settings.h"
#include "transfer_types.h"

class NativeCopyStrategy;
class QThreadPool;

// Picks how one file is transferred. Moves try a same-volume rename first;
// otherwise the native tool when enabled and present, ranged parallel streams
// for large files, and a single chunked stream for everything else.
CopyStrategy selectStrategy(OperationType type, qint64 sizeBytes, const TransferSettings& settings,
                            bool nativeAvailable);

struct TransferSnapshot {
    QString operationId;
    TransferStatus status = TransferStatus::Queued;
    qint64 bytesCopied = 0;
    qint64 totalBytes = 0;
    QDateTime startedAt;
};

// Executes one Operation. The per-operation TransferState lives here and is
// only written by the executing thread; other threads read it through
// snapshot().
class TransferTask {
public:
    using ProgressCallback = std::function<void(const TransferProgress&)>;

    TransferTask(const Operation& op, OperationType type, const TransferSettings& settings,
                 const NativeCopyStrategy* native = nullptr, QThreadPool* chunkPool = nullptr);
    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    // Never throws; every failure is folded into the result
    TransferResult execute(const CancellationToken& cancel, const ProgressCallback& onProgress = ProgressCallback());

    TransferSnapshot snapshot() const;
    const Operation& operation() const { return m_op; }

private:
    TransferResult finish(TransferResult r, TransferStatus status);
    bool tryRename(QString* errorOut);
    CopyResult copyParallel(const CancellationToken& cancel, qint64 size);
    void report(qint64 deltaBytes, bool force);
    void rollbackProgress();

    Operation m_op;
    OperationType m_type;
    TransferSettings m_settings;
    const NativeCopyStrategy* m_native;
    QThreadPool* m_chunkPool;

    std::atomic<int> m_status{int(TransferStatus::Queued)};
    std::atomic<qint64> m_bytesCopied{0};
    std::atomic<qint64> m_totalBytes{0};
    std::atomic<qint64> m_startedAtMs{0};

    // Guards progress emission, shared by parallel range streams
    QMutex m_progressMutex;
    ProgressThrottle m_throttle;
    ProgressCallback m_onProgress;
    qint64 m_pendingBytes = 0;
    qint64 m_reportedBytes = 0;
};
