#include "cancellation_registry.h"

#include <QDebug>
#include <QReadLocker>
#include <QWriteLocker>

CancellationToken::CancellationToken()
    : m_flag(std::make_shared<std::atomic_bool>(false))
{
}

bool CancellationToken::isCancelled() const
{
    if (m_flag->load(std::memory_order_acquire)) return true;
    return m_parent && m_parent->load(std::memory_order_acquire);
}

void CancellationToken::cancel()
{
    m_flag->store(true, std::memory_order_release);
}

CancellationToken CancellationToken::linked() const
{
    CancellationToken child;
    // Only one level of linking is needed: follow our own flag directly
    child.m_parent = m_flag;
    if (m_parent && m_parent->load(std::memory_order_acquire)) child.cancel();
    return child;
}

CancellationToken CancellationRegistry::registerBatch(const QString& batchId)
{
    QWriteLocker lk(&m_lock);
    auto it = m_tokens.find(batchId);
    if (it != m_tokens.end()) return it.value();
    CancellationToken token;
    m_tokens.insert(batchId, token);
    return token;
}

bool CancellationRegistry::cancel(const QString& batchId)
{
    QWriteLocker lk(&m_lock);
    auto it = m_tokens.find(batchId);
    if (it == m_tokens.end()) {
        CancellationToken token;
        token.cancel();
        m_tokens.insert(batchId, token);
        qInfo() << "[Registry] Cancel requested for unknown batch" << batchId;
        return false;
    }
    if (!it.value().isCancelled()) {
        qInfo() << "[Registry] Cancel requested for batch" << batchId;
    }
    it.value().cancel();
    return true;
}

bool CancellationRegistry::isCancelled(const QString& batchId) const
{
    QReadLocker lk(&m_lock);
    auto it = m_tokens.constFind(batchId);
    return it != m_tokens.constEnd() && it.value().isCancelled();
}

bool CancellationRegistry::contains(const QString& batchId) const
{
    QReadLocker lk(&m_lock);
    return m_tokens.contains(batchId);
}

CancellationToken CancellationRegistry::token(const QString& batchId) const
{
    QReadLocker lk(&m_lock);
    return m_tokens.value(batchId);
}

void CancellationRegistry::clear(const QString& batchId)
{
    QWriteLocker lk(&m_lock);
    m_tokens.remove(batchId);
}

int CancellationRegistry::size() const
{
    QReadLocker lk(&m_lock);
    return m_tokens.size();
}
