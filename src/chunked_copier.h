#pragma once
#include <QString>
#include <functional>

#include "cancellation_registry.h"
#include "transfer_types.h"

struct CopyResult {
    TransferError error = TransferError::None;
    qint64 bytes = 0;
    QString message;

    bool ok() const { return error == TransferError::None; }
};

// Copies file bytes in fixed-size chunks, checking the cancellation token
// before every read, before every write and after every chunk. Cancellation
// latency is therefore bounded by one chunk transfer.
class ChunkedCopier {
public:
    using ChunkCallback = std::function<void(qint64 chunkBytes)>;

    // Whole-file copy into a truncated/created destination. On cancellation or
    // any I/O error the partial destination is deleted. The caller verifies the
    // final size against the source.
    static CopyResult copy(const QString& src, const QString& dst, const CancellationToken& cancel,
                           qint64 chunkSize, const ChunkCallback& onChunk = ChunkCallback());

    // Copy [offset, offset + length) of src into the same region of an existing,
    // pre-sized destination. Leaves the destination in place on failure: it is
    // shared with sibling range streams and the caller removes it.
    static CopyResult copyRange(const QString& src, const QString& dst, qint64 offset, qint64 length,
                                const CancellationToken& cancel, qint64 chunkSize,
                                const ChunkCallback& onChunk = ChunkCallback());
};
