#pragma once
#include <QElapsedTimer>
#include <QtGlobal>

// Rate limiter for progress events: lets an event through when either the
// time interval has elapsed or enough bytes have accumulated since the last
// one. Not thread-safe; callers serialize access.
class ProgressThrottle {
public:
    ProgressThrottle(int intervalMs, qint64 byteStep);

    bool shouldEmit(qint64 pendingBytes);

private:
    QElapsedTimer m_timer;
    int m_intervalMs;
    qint64 m_byteStep;
};
