#include "progress_reporter.h"
#include <QDebug>
#include <QMutexLocker>

SignalProgressSink::SignalProgressSink(QObject* parent) : QObject(parent)
{
    qRegisterMetaType<ProgressEvent>("ProgressEvent");
    qRegisterMetaType<BatchSummary>("BatchSummary");
}

void SignalProgressSink::publish(const ProgressEvent& event)
{
    {
        QMutexLocker locker(&m_mutex);
        m_last.insert(event.snapshot.batchId, event);
    } // unlock before emitting so slots can query lastEvent()

    emit progress(event);
}

void SignalProgressSink::finished(const BatchSummary& summary)
{
    emit batchFinished(summary);
}

ProgressEvent SignalProgressSink::lastEvent(const QString& batchId) const
{
    QMutexLocker locker(&m_mutex);
    return m_last.value(batchId);
}

void LogProgressSink::publish(const ProgressEvent& event)
{
    const ProgressSnapshot& s = event.snapshot;
    qInfo().noquote() << QString("[Progress] %1 %2: %3/%4 files, %5/%6 bytes (%7%)%8")
        .arg(s.batchId, toString(s.state))
        .arg(s.filesProcessed).arg(s.totalFiles)
        .arg(s.bytesProcessed).arg(s.totalBytes)
        .arg(s.percentage, 0, 'f', 1)
        .arg(s.etaSeconds >= 0 ? QString(" eta %1s").arg(s.etaSeconds) : QString());
}

void LogProgressSink::finished(const BatchSummary& summary)
{
    qInfo().noquote() << QString("[Progress] %1 finished %2: %3 succeeded, %4 failed, %5 cancelled")
        .arg(summary.batchId, toString(summary.state))
        .arg(summary.succeeded.size())
        .arg(summary.failed.size())
        .arg(summary.cancelledCount);
}
