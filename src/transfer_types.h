#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>

enum class OperationKind { File, SequenceMember };
enum class OperationType { Copy, Move };

// Batch lifecycle: Pending -> Running -> (Completed | Cancelled | Failed),
// with Running -> Cancelling -> Cancelled while in-flight tasks drain.
enum class BatchState { Pending, Running, Cancelling, Cancelled, Completed, Failed };

enum class TransferStatus { Queued, Copying, Verifying, Done, Cancelled, Error };

enum class TransferError {
    None,
    IoFailure,
    Cancelled,
    VerificationFailure,
    NativeToolUnavailable,
    NativeToolFailure,
    SourceDeleteFailure,
    InvalidConfiguration
};

enum class CopyStrategy { Rename, NativeTool, ChunkedCopy, ParallelChunks };

// One source -> destination transfer. Produced by the mapping engine and never
// mutated by the transfer engine.
struct Operation {
    QString id;
    QString sourcePath;
    QString destinationPath;
    OperationKind kind = OperationKind::File;
    qint64 sizeBytes = -1; // negative = unknown, resolved from the source at batch start
    QString sequenceId;    // empty for standalone files
};

struct TransferResult {
    QString operationId;
    bool success = false;
    qint64 bytes = 0;
    TransferError error = TransferError::None;
    QString errorMessage;
    // Set on an otherwise successful move whose source could not be deleted
    TransferError warning = TransferError::None;
    QString warningMessage;
    CopyStrategy strategy = CopyStrategy::ChunkedCopy;

    bool cancelled() const { return error == TransferError::Cancelled; }
};

// Throttled per-operation progress, emitted by TransferTask.
// deltaBytes is the change since the previous emission and goes negative when
// a partial destination is discarded.
struct TransferProgress {
    QString operationId;
    QString currentFile;
    qint64 bytesCopied = 0;
    qint64 totalBytes = 0;
    qint64 deltaBytes = 0;
};

struct ProgressSnapshot {
    QString batchId;
    int filesProcessed = 0;
    int totalFiles = 0;
    qint64 bytesProcessed = 0;
    qint64 totalBytes = 0;
    double percentage = 0.0;
    QString currentFile;
    BatchState state = BatchState::Pending;
    qint64 etaSeconds = -1; // -1 while unknown
    double bytesPerSecond = 0.0;

    QJsonObject toJson() const;
};

struct ProgressEvent {
    ProgressSnapshot snapshot;
    QDateTime timestamp;

    QJsonObject toJson() const;
};

struct FailedOperation {
    QString operationId;
    TransferError error = TransferError::None;
    QString message; // only kept for the first few failures of a batch
};

struct SequenceOutcome {
    QString sequenceId;
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    int cancelled = 0;

    bool isPartial() const { return succeeded > 0 && succeeded < total; }
};

struct UndoEntry {
    QString operationId;
    QString sourcePath;
    QString destinationPath;
    OperationType type = OperationType::Copy;
};

struct BatchSummary {
    QString batchId;
    BatchState state = BatchState::Pending;
    QStringList succeeded;
    QVector<FailedOperation> failed;
    QVector<FailedOperation> warnings;
    int cancelledCount = 0;
    int suppressedErrorDetails = 0;
    qint64 bytesTransferred = 0;
    QVector<SequenceOutcome> sequences;

    QJsonObject toJson() const;
};

QString toString(OperationKind kind);
QString toString(OperationType type);
QString toString(BatchState state);
QString toString(TransferStatus status);
QString toString(TransferError error);
QString toString(CopyStrategy strategy);

bool operationTypeFromString(const QString& text, OperationType& out);
bool operationKindFromString(const QString& text, OperationKind& out);

inline bool isTerminal(BatchState state)
{
    return state == BatchState::Completed || state == BatchState::Cancelled || state == BatchState::Failed;
}

Q_DECLARE_METATYPE(ProgressEvent)
Q_DECLARE_METATYPE(BatchSummary)
