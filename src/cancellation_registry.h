#pragma once
#include <QString>
#include <QHash>
#include <QReadWriteLock>
#include <atomic>
#include <memory>

// Copyable handle to a shared cancellation flag. Once cancelled it never
// resets. A linked token also reports cancelled when its parent is.
class CancellationToken {
public:
    CancellationToken();

    bool isCancelled() const;
    void cancel();

    // Token that can be cancelled on its own (e.g. to abort sibling chunk
    // streams of one file) while still following this token
    CancellationToken linked() const;

private:
    std::shared_ptr<std::atomic_bool> m_flag;
    std::shared_ptr<std::atomic_bool> m_parent;
};

// Process-wide map batch id -> cancellation flag. Owned by the long-lived
// service context (BatchCoordinator owner) rather than a true global, so
// tests can create isolated instances.
class CancellationRegistry {
public:
    CancellationRegistry() = default;
    CancellationRegistry(const CancellationRegistry&) = delete;
    CancellationRegistry& operator=(const CancellationRegistry&) = delete;

    // Returns the existing token when the batch id is already registered
    CancellationToken registerBatch(const QString& batchId);

    // Idempotent. Returns false when the batch id was unknown; an entry is
    // created in the cancelled state so a later registerBatch() sees it.
    bool cancel(const QString& batchId);

    bool isCancelled(const QString& batchId) const;
    bool contains(const QString& batchId) const;
    CancellationToken token(const QString& batchId) const;
    void clear(const QString& batchId);
    int size() const;

private:
    mutable QReadWriteLock m_lock;
    QHash<QString, CancellationToken> m_tokens;
};
