#pragma once
#include <QObject>
#include <QString>
#include <QStringList>
#include <QHash>
#include <QReadWriteLock>
#include <QThreadPool>
#include <memory>

#include "batch_request.h"
#include "cancellation_registry.h"
#include "transfer_settings.h"
#include "transfer_types.h"

class ProgressSink;
struct BatchResult;
struct TransferProgress;

// Entry point of the transfer engine. start() registers the batch's
// cancellation signal, hands its operations to a WorkerPool on a background
// runner and returns immediately; callers poll status() or subscribe through
// a ProgressSink / the batchFinished signal.
//
// status(), summary() and undoJournal() are safe to call concurrently from any
// thread. A terminal batch keeps answering with the same values until
// release() acknowledges it.
class BatchCoordinator : public QObject {
    Q_OBJECT
public:
    BatchCoordinator(CancellationRegistry& registry, const TransferSettings& settings, QObject* parent = nullptr);
    ~BatchCoordinator() override;

    // Not owned. Set before the first start().
    void setProgressSink(ProgressSink* sink) { m_sink = sink; }

    // Returns the batch id, or an empty string with errorOut set when the
    // request or the resulting configuration is invalid
    QString start(const BatchRequest& request, QString* errorOut = nullptr);

    // Non-blocking; the batch moves to Cancelling, then Cancelled once its
    // in-flight tasks drain. Has no effect on a batch that already finished.
    bool cancel(const QString& batchId);

    bool contains(const QString& batchId) const;
    ProgressSnapshot status(const QString& batchId) const;
    BatchSummary summary(const QString& batchId) const;
    QVector<UndoEntry> undoJournal(const QString& batchId) const;
    QStringList batchIds() const;

    bool waitForFinished(const QString& batchId, int timeoutMs = -1) const;

    // Drops a terminal batch and clears its cancellation entry
    bool release(const QString& batchId);

    static constexpr int MAX_CONCURRENT_BATCHES = 8;

signals:
    void batchStarted(const QString& batchId);
    void batchStatusChanged(const QString& batchId, const QString& status);
    void batchFinished(const QString& batchId, const BatchSummary& summary);

private:
    struct Batch;

    std::shared_ptr<Batch> find(const QString& batchId) const;
    void runBatch(const std::shared_ptr<Batch>& batch);
    void onProgress(Batch& batch, const TransferProgress& p);
    void onResult(Batch& batch, const Operation& op, const TransferResult& r);
    void publish(Batch& batch, bool force);
    ProgressSnapshot makeSnapshot(const Batch& batch) const;
    BatchSummary buildSummary(const Batch& batch, const BatchResult& result, BatchState state) const;

    CancellationRegistry& m_registry;
    TransferSettings m_settings;
    ProgressSink* m_sink = nullptr;

    mutable QReadWriteLock m_lock;
    QHash<QString, std::shared_ptr<Batch>> m_batches;
    QThreadPool m_runners;
};
