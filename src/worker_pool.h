#pragma once
#include <QVector>
#include <QHash>
#include <QMutex>
#include <QThreadPool>
#include <atomic>
#include <functional>

#include "cancellation_registry.h"
#include "native_copy_strategy.h"
#include "transfer_settings.h"
#include "transfer_task.h"
#include "transfer_types.h"

struct BatchResult {
    QVector<TransferResult> results; // submission order
    int succeeded = 0;
    int failed = 0;
    int cancelled = 0;
};

// Runs the TransferTasks of one batch with two nested limits: at most
// maxFileConcurrency files in flight, each using at most maxChunkConcurrency
// range streams. The chunk streams run on their own pool so a file worker
// waiting on its streams never starves them. Product of the two knobs is the
// number of concurrent I/O streams (guideline: 32).
class WorkerPool {
public:
    using ProgressCallback = TransferTask::ProgressCallback;
    // Invoked on the worker thread as soon as an operation finishes
    using ResultCallback = std::function<void(const Operation&, const TransferResult&)>;

    explicit WorkerPool(const TransferSettings& settings);
    ~WorkerPool();

    // Tasks start in submission order. One failure never stops the others;
    // once the token fires no further task touches the filesystem.
    BatchResult submitBatch(const QVector<Operation>& operations, OperationType type, const CancellationToken& cancel,
                            const ProgressCallback& onProgress = ProgressCallback(),
                            const ResultCallback& onResult = ResultCallback());

    int peakConcurrency() const { return m_peak.load(); }
    int activeCount() const { return m_active.load(); }
    QVector<TransferSnapshot> activeTransfers() const;

private:
    TransferResult runOne(const Operation& op, OperationType type, const CancellationToken& cancel,
                          const ProgressCallback& onProgress);

    TransferSettings m_settings;
    NativeCopyStrategy m_native;
    QThreadPool m_filePool;
    QThreadPool m_chunkPool;

    std::atomic<int> m_active{0};
    std::atomic<int> m_peak{0};
    mutable QMutex m_inFlightMutex;
    QHash<QString, TransferTask*> m_inFlight;
};
