#include "transfer_types.h"

#include <QJsonArray>

QString toString(OperationKind kind)
{
    switch (kind) {
        case OperationKind::File: return "file";
        case OperationKind::SequenceMember: return "sequence_member";
    }
    return "";
}

QString toString(OperationType type)
{
    switch (type) {
        case OperationType::Copy: return "copy";
        case OperationType::Move: return "move";
    }
    return "";
}

QString toString(BatchState state)
{
    switch (state) {
        case BatchState::Pending: return "pending";
        case BatchState::Running: return "running";
        case BatchState::Cancelling: return "cancelling";
        case BatchState::Cancelled: return "cancelled";
        case BatchState::Completed: return "completed";
        case BatchState::Failed: return "failed";
    }
    return "";
}

QString toString(TransferStatus status)
{
    switch (status) {
        case TransferStatus::Queued: return "queued";
        case TransferStatus::Copying: return "copying";
        case TransferStatus::Verifying: return "verifying";
        case TransferStatus::Done: return "done";
        case TransferStatus::Cancelled: return "cancelled";
        case TransferStatus::Error: return "error";
    }
    return "";
}

QString toString(TransferError error)
{
    switch (error) {
        case TransferError::None: return "none";
        case TransferError::IoFailure: return "io_failure";
        case TransferError::Cancelled: return "cancelled";
        case TransferError::VerificationFailure: return "verification_failure";
        case TransferError::NativeToolUnavailable: return "native_tool_unavailable";
        case TransferError::NativeToolFailure: return "native_tool_failure";
        case TransferError::SourceDeleteFailure: return "source_delete_failure";
        case TransferError::InvalidConfiguration: return "invalid_configuration";
    }
    return "";
}

QString toString(CopyStrategy strategy)
{
    switch (strategy) {
        case CopyStrategy::Rename: return "rename";
        case CopyStrategy::NativeTool: return "native_tool";
        case CopyStrategy::ChunkedCopy: return "chunked_copy";
        case CopyStrategy::ParallelChunks: return "parallel_chunks";
    }
    return "";
}

bool operationTypeFromString(const QString& text, OperationType& out)
{
    const QString t = text.trimmed().toLower();
    if (t == "copy") { out = OperationType::Copy; return true; }
    if (t == "move") { out = OperationType::Move; return true; }
    return false;
}

bool operationKindFromString(const QString& text, OperationKind& out)
{
    const QString t = text.trimmed().toLower();
    if (t.isEmpty() || t == "file") { out = OperationKind::File; return true; }
    // The mapping engine tags whole sequences as "sequence"; each expanded frame is a member
    if (t == "sequence_member" || t == "sequence") { out = OperationKind::SequenceMember; return true; }
    return false;
}

QJsonObject ProgressSnapshot::toJson() const
{
    QJsonObject o;
    o["batch_id"] = batchId;
    o["files_processed"] = filesProcessed;
    o["total_files"] = totalFiles;
    o["bytes_processed"] = double(bytesProcessed);
    o["total_bytes"] = double(totalBytes);
    o["percentage"] = percentage;
    o["current_file"] = currentFile;
    o["status"] = toString(state);
    if (etaSeconds >= 0) o["eta_seconds"] = double(etaSeconds);
    o["bytes_per_second"] = bytesPerSecond;
    return o;
}

QJsonObject ProgressEvent::toJson() const
{
    QJsonObject o = snapshot.toJson();
    o["timestamp"] = timestamp.toString(Qt::ISODateWithMs);
    return o;
}

QJsonObject BatchSummary::toJson() const
{
    QJsonObject o;
    o["batch_id"] = batchId;
    o["status"] = toString(state);
    o["succeeded"] = QJsonArray::fromStringList(succeeded);

    QJsonArray failedArr;
    for (const auto& f : failed) {
        QJsonObject fo;
        fo["operation_id"] = f.operationId;
        fo["error"] = toString(f.error);
        if (!f.message.isEmpty()) fo["message"] = f.message;
        failedArr.append(fo);
    }
    o["failed"] = failedArr;

    QJsonArray warnArr;
    for (const auto& w : warnings) {
        QJsonObject wo;
        wo["operation_id"] = w.operationId;
        wo["warning"] = toString(w.error);
        if (!w.message.isEmpty()) wo["message"] = w.message;
        warnArr.append(wo);
    }
    if (!warnArr.isEmpty()) o["warnings"] = warnArr;

    o["cancelled_count"] = cancelledCount;
    o["bytes_transferred"] = double(bytesTransferred);
    if (suppressedErrorDetails > 0) o["suppressed_error_details"] = suppressedErrorDetails;

    QJsonArray seqArr;
    for (const auto& s : sequences) {
        QJsonObject so;
        so["sequence_id"] = s.sequenceId;
        so["total"] = s.total;
        so["succeeded"] = s.succeeded;
        so["failed"] = s.failed;
        so["cancelled"] = s.cancelled;
        so["partial"] = s.isPartial();
        seqArr.append(so);
    }
    if (!seqArr.isEmpty()) o["sequences"] = seqArr;
    return o;
}
