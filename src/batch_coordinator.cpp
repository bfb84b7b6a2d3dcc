#include "batch_coordinator.h"
#include "progress_reporter.h"
#include "progress_throttle.h"
#include "worker_pool.h"
#include "file_utils.h"

#include <QDateTime>
#include <QDeadlineTimer>
#include <QMutex>
#include <QMutexLocker>
#include <QReadLocker>
#include <QWriteLocker>
#include <QWaitCondition>
#include <QUuid>
#include <QDebug>

#include <algorithm>
#include <atomic>

struct BatchCoordinator::Batch {
    explicit Batch(const TransferSettings& s)
        : settings(s), throttle(s.progressIntervalMs, s.progressByteStep) {}

    QString id;
    BatchRequest request;
    TransferSettings settings;
    CancellationToken token;
    int totalFiles = 0;
    qint64 totalBytes = 0;

    std::atomic<int> state{int(BatchState::Pending)};
    std::atomic<int> filesProcessed{0};
    std::atomic<qint64> bytesProcessed{0};
    std::atomic<qint64> skippedBytes{0}; // declared sizes of failed/cancelled operations
    std::atomic<qint64> startedAtMs{0};

    // Guards everything below
    mutable QMutex mutex;
    QString currentFile;
    ProgressThrottle throttle;
    qint64 bytesAtLastEvent = 0;
    QVector<UndoEntry> journal;
    BatchSummary summary;
    bool summaryReady = false;
    // Set last, once the sink and signal receivers have been served
    bool finished = false;
    mutable QWaitCondition finishedCond;
};

BatchCoordinator::BatchCoordinator(CancellationRegistry& registry, const TransferSettings& settings, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_settings(settings)
{
    qRegisterMetaType<BatchSummary>("BatchSummary");
    qRegisterMetaType<ProgressEvent>("ProgressEvent");
    m_runners.setMaxThreadCount(MAX_CONCURRENT_BATCHES);
}

BatchCoordinator::~BatchCoordinator()
{
    QStringList running;
    {
        QReadLocker lk(&m_lock);
        for (auto it = m_batches.constBegin(); it != m_batches.constEnd(); ++it)
            if (!isTerminal(BatchState(it.value()->state.load()))) running << it.key();
    }
    for (const QString& id : running) cancel(id);
    m_runners.waitForDone();
}

std::shared_ptr<BatchCoordinator::Batch> BatchCoordinator::find(const QString& batchId) const
{
    QReadLocker lk(&m_lock);
    return m_batches.value(batchId);
}

bool BatchCoordinator::contains(const QString& batchId) const
{
    QReadLocker lk(&m_lock);
    return m_batches.contains(batchId);
}

QStringList BatchCoordinator::batchIds() const
{
    QReadLocker lk(&m_lock);
    return m_batches.keys();
}

QString BatchCoordinator::start(const BatchRequest& request, QString* errorOut)
{
    auto fail = [errorOut](const QString& msg) {
        qWarning() << "[Batch] Rejected request:" << msg;
        if (errorOut) *errorOut = msg;
        return QString();
    };

    QString err;
    if (!request.validate(&err)) return fail(err);
    const TransferSettings settings = request.effectiveSettings(m_settings);
    if (!settings.validate(&err)) return fail(err);

    auto batch = std::make_shared<Batch>(settings);
    batch->id = request.batchId.isEmpty() ? QUuid::createUuid().toString(QUuid::WithoutBraces) : request.batchId;
    batch->request = request;
    batch->request.batchId = batch->id;

    for (Operation& op : batch->request.operations) {
        if (op.sizeBytes < 0) op.sizeBytes = std::max<qint64>(0, FileUtils::fileSize(op.sourcePath));
        batch->totalBytes += op.sizeBytes;
    }
    batch->totalFiles = batch->request.operations.size();

    {
        QWriteLocker lk(&m_lock);
        if (m_batches.contains(batch->id)) {
            lk.unlock();
            return fail(QObject::tr("Batch id '%1' is already in use").arg(batch->id));
        }
        // A cancel that arrived before start() leaves a cancelled entry behind
        batch->token = m_registry.registerBatch(batch->id);
        m_batches.insert(batch->id, batch);
    }

    qInfo() << "[Batch] Start" << batch->id << toString(request.operationType) << batch->totalFiles << "files,"
            << batch->totalBytes << "bytes";
    emit batchStarted(batch->id);

    m_runners.start([this, batch]() { runBatch(batch); });
    return batch->id;
}

bool BatchCoordinator::cancel(const QString& batchId)
{
    const bool known = m_registry.cancel(batchId);
    auto batch = find(batchId);
    if (!batch) return known;

    int cur = batch->state.load();
    while (cur == int(BatchState::Pending) || cur == int(BatchState::Running)) {
        if (batch->state.compare_exchange_weak(cur, int(BatchState::Cancelling))) {
            qInfo() << "[Batch]" << batchId << "cancelling";
            emit batchStatusChanged(batchId, toString(BatchState::Cancelling));
            publish(*batch, true);
            break;
        }
    }
    return true;
}

ProgressSnapshot BatchCoordinator::status(const QString& batchId) const
{
    auto batch = find(batchId);
    if (!batch) return ProgressSnapshot();
    QMutexLocker lk(&batch->mutex);
    return makeSnapshot(*batch);
}

BatchSummary BatchCoordinator::summary(const QString& batchId) const
{
    auto batch = find(batchId);
    if (!batch) return BatchSummary();
    QMutexLocker lk(&batch->mutex);
    if (batch->summaryReady) return batch->summary;
    BatchSummary s;
    s.batchId = batch->id;
    s.state = BatchState(batch->state.load());
    return s;
}

QVector<UndoEntry> BatchCoordinator::undoJournal(const QString& batchId) const
{
    auto batch = find(batchId);
    if (!batch) return {};
    QMutexLocker lk(&batch->mutex);
    return batch->journal;
}

bool BatchCoordinator::waitForFinished(const QString& batchId, int timeoutMs) const
{
    auto batch = find(batchId);
    if (!batch) return false;
    QDeadlineTimer deadline(timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever) : QDeadlineTimer(timeoutMs));
    QMutexLocker lk(&batch->mutex);
    while (!batch->finished) {
        if (!batch->finishedCond.wait(&batch->mutex, deadline)) return batch->finished;
    }
    return true;
}

bool BatchCoordinator::release(const QString& batchId)
{
    QWriteLocker lk(&m_lock);
    auto it = m_batches.find(batchId);
    if (it == m_batches.end()) return false;
    {
        QMutexLocker blk(&it.value()->mutex);
        if (!it.value()->finished) return false;
    }
    m_batches.erase(it);
    m_registry.clear(batchId);
    qDebug() << "[Batch] Released" << batchId;
    return true;
}

ProgressSnapshot BatchCoordinator::makeSnapshot(const Batch& batch) const
{
    ProgressSnapshot s;
    s.batchId = batch.id;
    s.state = BatchState(batch.state.load());
    s.filesProcessed = batch.filesProcessed.load();
    s.totalFiles = batch.totalFiles;
    s.bytesProcessed = batch.bytesProcessed.load();
    s.totalBytes = batch.totalBytes;
    s.currentFile = batch.currentFile;

    // Failed and cancelled operations count as settled at their declared size
    double done = 0.0;
    double total = 0.0;
    if (batch.totalBytes > 0) {
        done = double(std::max<qint64>(0, s.bytesProcessed + batch.skippedBytes.load()));
        total = double(batch.totalBytes);
    } else {
        done = s.filesProcessed;
        total = s.totalFiles;
    }
    s.percentage = total > 0.0 ? std::min(100.0, done * 100.0 / total) : (isTerminal(s.state) ? 100.0 : 0.0);

    const qint64 startedMs = batch.startedAtMs.load();
    if (startedMs > 0) {
        const double elapsed = (QDateTime::currentMSecsSinceEpoch() - startedMs) / 1000.0;
        if (elapsed > 0.0) s.bytesPerSecond = s.bytesProcessed / elapsed;
        if (isTerminal(s.state)) s.etaSeconds = 0;
        else if (done > 0.0 && total > done && elapsed > 0.0) s.etaSeconds = qint64(elapsed * (total - done) / done);
    }
    return s;
}

void BatchCoordinator::publish(Batch& batch, bool force)
{
    if (!m_sink) return;
    QMutexLocker lk(&batch.mutex);
    const qint64 bytes = batch.bytesProcessed.load();
    if (!force && !batch.throttle.shouldEmit(bytes - batch.bytesAtLastEvent)) return;
    batch.bytesAtLastEvent = bytes;
    ProgressEvent ev;
    ev.snapshot = makeSnapshot(batch);
    ev.timestamp = QDateTime::currentDateTimeUtc();
    lk.unlock();
    m_sink->publish(ev);
}

void BatchCoordinator::onProgress(Batch& batch, const TransferProgress& p)
{
    batch.bytesProcessed.fetch_add(p.deltaBytes);
    {
        QMutexLocker lk(&batch.mutex);
        batch.currentFile = p.currentFile;
    }
    publish(batch, false);
}

void BatchCoordinator::onResult(Batch& batch, const Operation& op, const TransferResult& r)
{
    batch.filesProcessed.fetch_add(1);
    if (!r.success) batch.skippedBytes.fetch_add(op.sizeBytes);
    {
        QMutexLocker lk(&batch.mutex);
        if (r.success) {
            UndoEntry u;
            u.operationId = op.id;
            u.sourcePath = op.sourcePath;
            u.destinationPath = op.destinationPath;
            u.type = batch.request.operationType;
            batch.journal.push_back(u);
        }
    }
    publish(batch, false);
}

BatchSummary BatchCoordinator::buildSummary(const Batch& batch, const BatchResult& result, BatchState state) const
{
    BatchSummary s;
    s.batchId = batch.id;
    s.state = state;

    QHash<QString, int> seqIndex;
    const QVector<Operation>& ops = batch.request.operations;
    for (int i = 0; i < result.results.size() && i < ops.size(); ++i) {
        const TransferResult& r = result.results[i];
        const Operation& op = ops[i];

        SequenceOutcome* seq = nullptr;
        if (!op.sequenceId.isEmpty()) {
            auto it = seqIndex.find(op.sequenceId);
            if (it == seqIndex.end()) {
                SequenceOutcome so;
                so.sequenceId = op.sequenceId;
                s.sequences.push_back(so);
                it = seqIndex.insert(op.sequenceId, s.sequences.size() - 1);
            }
            seq = &s.sequences[it.value()];
            seq->total += 1;
        }

        if (r.success) {
            s.succeeded << op.id;
            s.bytesTransferred += r.bytes;
            if (seq) seq->succeeded += 1;
            if (r.warning != TransferError::None) {
                FailedOperation w;
                w.operationId = op.id;
                w.error = r.warning;
                w.message = r.warningMessage;
                s.warnings.push_back(w);
            }
        } else if (r.cancelled()) {
            s.cancelledCount += 1;
            if (seq) seq->cancelled += 1;
        } else {
            FailedOperation f;
            f.operationId = op.id;
            // Verification mismatches are reported as I/O failures
            f.error = r.error == TransferError::VerificationFailure ? TransferError::IoFailure : r.error;
            if (s.failed.size() < batch.settings.maxErrorDetails) f.message = r.errorMessage;
            else s.suppressedErrorDetails += 1;
            s.failed.push_back(f);
            if (seq) seq->failed += 1;
        }
    }
    return s;
}

void BatchCoordinator::runBatch(const std::shared_ptr<Batch>& batch)
{
    int expected = int(BatchState::Pending);
    if (batch->state.compare_exchange_strong(expected, int(BatchState::Running)))
        emit batchStatusChanged(batch->id, toString(BatchState::Running));
    batch->startedAtMs.store(QDateTime::currentMSecsSinceEpoch());
    publish(*batch, true);

    BatchResult result;
    {
        WorkerPool pool(batch->settings);
        Batch* b = batch.get();
        result = pool.submitBatch(
            b->request.operations, b->request.operationType, b->token,
            [this, b](const TransferProgress& p) { onProgress(*b, p); },
            [this, b](const Operation& op, const TransferResult& r) { onResult(*b, op, r); });
    }

    // Settle the terminal state against a concurrent cancel()
    BatchState finalState = BatchState::Completed;
    int cur = batch->state.load();
    for (;;) {
        if (cur == int(BatchState::Cancelling) || (batch->token.isCancelled() && result.cancelled > 0))
            finalState = BatchState::Cancelled;
        else if (result.succeeded == 0 && result.failed > 0)
            finalState = BatchState::Failed;
        else
            finalState = BatchState::Completed;
        if (batch->state.compare_exchange_weak(cur, int(finalState))) break;
    }

    const BatchSummary summary = buildSummary(*batch, result, finalState);
    {
        QMutexLocker lk(&batch->mutex);
        batch->summary = summary;
        batch->summaryReady = true;
        batch->currentFile.clear();
    }

    qInfo() << "[Batch]" << batch->id << toString(finalState) << "-" << summary.succeeded.size() << "succeeded,"
            << summary.failed.size() << "failed," << summary.cancelledCount << "cancelled,"
            << summary.warnings.size() << "warnings";

    publish(*batch, true);
    if (m_sink) m_sink->finished(summary);
    emit batchStatusChanged(batch->id, toString(finalState));
    emit batchFinished(batch->id, summary);

    QMutexLocker lk(&batch->mutex);
    batch->finished = true;
    batch->finishedCond.wakeAll();
}
