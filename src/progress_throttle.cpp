#include "progress_throttle.h"

ProgressThrottle::ProgressThrottle(int intervalMs, qint64 byteStep)
    : m_intervalMs(intervalMs), m_byteStep(byteStep)
{
    m_timer.start();
}

bool ProgressThrottle::shouldEmit(qint64 pendingBytes)
{
    const bool byTime = m_timer.elapsed() >= m_intervalMs;
    const bool byBytes = m_byteStep > 0 && pendingBytes >= m_byteStep;
    if (!byTime && !byBytes) return false;
    m_timer.restart();
    return true;
}
