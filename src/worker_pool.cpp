#include "worker_pool.h"

#include <QObject>
#include <QtConcurrent>
#include <QMutexLocker>
#include <QDebug>

#include <exception>

WorkerPool::WorkerPool(const TransferSettings& settings)
    : m_settings(settings)
    , m_native(settings.nativeToolPath, settings.nativeToolThreads)
{
    m_filePool.setMaxThreadCount(qMax(1, settings.maxFileConcurrency));
    m_chunkPool.setMaxThreadCount(qMax(1, settings.maxFileConcurrency * settings.maxChunkConcurrency));
    if (m_settings.nativeToolEnabled && !m_native.isAvailable())
        qInfo() << "[Pool]" << NativeCopyStrategy::defaultToolName() << "not found, native copies disabled";
}

WorkerPool::~WorkerPool()
{
    m_filePool.waitForDone();
    m_chunkPool.waitForDone();
}

QVector<TransferSnapshot> WorkerPool::activeTransfers() const
{
    QMutexLocker lk(&m_inFlightMutex);
    QVector<TransferSnapshot> out;
    out.reserve(m_inFlight.size());
    for (auto it = m_inFlight.constBegin(); it != m_inFlight.constEnd(); ++it)
        out.push_back(it.value()->snapshot());
    return out;
}

TransferResult WorkerPool::runOne(const Operation& op, OperationType type, const CancellationToken& cancel,
                                  const ProgressCallback& onProgress)
{
    TransferTask task(op, type, m_settings, &m_native, &m_chunkPool);

    const int now = m_active.fetch_add(1) + 1;
    int peak = m_peak.load();
    while (now > peak && !m_peak.compare_exchange_weak(peak, now)) {}
    {
        QMutexLocker lk(&m_inFlightMutex);
        m_inFlight.insert(op.id, &task);
    }

    TransferResult r;
    try {
        r = task.execute(cancel, onProgress);
    } catch (const std::exception& e) {
        // Keep the worker alive; the failure belongs to this operation only
        r.operationId = op.id;
        r.success = false;
        r.error = TransferError::IoFailure;
        r.errorMessage = QObject::tr("Unexpected error: %1").arg(QString::fromLocal8Bit(e.what()));
        qCritical() << "[Pool]" << op.id << r.errorMessage;
    }

    {
        QMutexLocker lk(&m_inFlightMutex);
        m_inFlight.remove(op.id);
    }
    m_active.fetch_sub(1);
    return r;
}

BatchResult WorkerPool::submitBatch(const QVector<Operation>& operations, OperationType type,
                                    const CancellationToken& cancel, const ProgressCallback& onProgress,
                                    const ResultCallback& onResult)
{
    BatchResult batch;
    batch.results.resize(operations.size());

    qInfo() << "[Pool] Submitting" << operations.size() << toString(type) << "operations,"
            << m_settings.maxFileConcurrency << "files x" << m_settings.maxChunkConcurrency << "streams";

    QVector<QFuture<TransferResult>> futures;
    futures.reserve(operations.size());
    for (const Operation& op : operations) {
        futures.push_back(QtConcurrent::run(&m_filePool, [this, op, type, cancel, onProgress, onResult]() {
            TransferResult r = runOne(op, type, cancel, onProgress);
            if (onResult) onResult(op, r);
            return r;
        }));
    }

    for (int i = 0; i < futures.size(); ++i) {
        futures[i].waitForFinished();
        const TransferResult r = futures[i].result();
        batch.results[i] = r;
        if (r.success) ++batch.succeeded;
        else if (r.cancelled()) ++batch.cancelled;
        else ++batch.failed;
    }

    qInfo() << "[Pool] Batch done:" << batch.succeeded << "succeeded," << batch.failed << "failed,"
            << batch.cancelled << "cancelled, peak concurrency" << m_peak.load();
    return batch;
}
