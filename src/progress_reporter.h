#ifndef PROGRESS_REPORTER_H
#define PROGRESS_REPORTER_H

#include <QObject>
#include <QString>
#include <QMutex>
#include <QHash>

#include "transfer_types.h"

// Receiver of batch progress events. publish() is called from worker threads
// at a bounded rate; implementations must be thread-safe.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void publish(const ProgressEvent& event) = 0;
    virtual void finished(const BatchSummary& summary) { Q_UNUSED(summary); }
};

// Re-emits events as Qt signals, queued to the receivers' threads
class SignalProgressSink : public QObject, public ProgressSink {
    Q_OBJECT
public:
    explicit SignalProgressSink(QObject* parent = nullptr);

    void publish(const ProgressEvent& event) override;
    void finished(const BatchSummary& summary) override;

    ProgressEvent lastEvent(const QString& batchId) const;

signals:
    void progress(const ProgressEvent& event);
    void batchFinished(const BatchSummary& summary);

private:
    mutable QMutex m_mutex;
    QHash<QString, ProgressEvent> m_last;
};

// Writes one log line per event through the Qt message handler
class LogProgressSink : public ProgressSink {
public:
    void publish(const ProgressEvent& event) override;
    void finished(const BatchSummary& summary) override;
};

#endif // PROGRESS_REPORTER_H
