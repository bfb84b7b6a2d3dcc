#include "transfer_settings.h"

#include <QObject>
#include <QSettings>
#include <QDebug>

bool TransferSettings::validate(QString* errorOut) const
{
    auto fail = [errorOut](const QString& msg) {
        if (errorOut) *errorOut = msg;
        return false;
    };
    if (chunkSize < MIN_CHUNK_SIZE || chunkSize > MAX_CHUNK_SIZE)
        return fail(QObject::tr("chunk_size %1 outside [%2, %3]").arg(chunkSize).arg(MIN_CHUNK_SIZE).arg(MAX_CHUNK_SIZE));
    if (maxFileConcurrency < 1 || maxFileConcurrency > MAX_CONCURRENCY)
        return fail(QObject::tr("max_file_concurrency %1 outside [1, %2]").arg(maxFileConcurrency).arg(MAX_CONCURRENCY));
    if (maxChunkConcurrency < 1 || maxChunkConcurrency > MAX_CONCURRENCY)
        return fail(QObject::tr("max_chunk_concurrency %1 outside [1, %2]").arg(maxChunkConcurrency).arg(MAX_CONCURRENCY));
    if (largeFileThreshold < 0)
        return fail(QObject::tr("large_file_threshold must not be negative"));
    if (nativeToolThreads < 1 || nativeToolThreads > 128)
        return fail(QObject::tr("native_tool_threads %1 outside [1, 128]").arg(nativeToolThreads));
    if (progressIntervalMs < 0 || progressByteStep < 0)
        return fail(QObject::tr("progress rate limits must not be negative"));
    if (maxErrorDetails < 0)
        return fail(QObject::tr("max_error_details must not be negative"));

    // Sizing guideline only; the right product depends on the storage
    if (maxFileConcurrency * maxChunkConcurrency > STREAM_GUIDELINE) {
        qWarning() << "[Settings]" << maxFileConcurrency << "files x" << maxChunkConcurrency
                   << "chunk streams exceeds the guideline of" << STREAM_GUIDELINE << "concurrent I/O streams";
    }
    return true;
}

void TransferSettings::load(QSettings& s)
{
    const TransferSettings d;
    s.beginGroup("transfer");
    chunkSize = s.value("chunk_size", d.chunkSize).toLongLong();
    largeFileThreshold = s.value("large_file_threshold", d.largeFileThreshold).toLongLong();
    maxFileConcurrency = s.value("max_file_concurrency", d.maxFileConcurrency).toInt();
    maxChunkConcurrency = s.value("max_chunk_concurrency", d.maxChunkConcurrency).toInt();
    nativeToolEnabled = s.value("native_tool_enabled", d.nativeToolEnabled).toBool();
    nativeToolPath = s.value("native_tool_path", d.nativeToolPath).toString();
    nativeToolThreads = s.value("native_tool_threads", d.nativeToolThreads).toInt();
    renameForMove = s.value("rename_for_move", d.renameForMove).toBool();
    progressIntervalMs = s.value("progress_interval_ms", d.progressIntervalMs).toInt();
    progressByteStep = s.value("progress_byte_step", d.progressByteStep).toLongLong();
    maxErrorDetails = s.value("max_error_details", d.maxErrorDetails).toInt();
    s.endGroup();
}

void TransferSettings::save(QSettings& s) const
{
    s.beginGroup("transfer");
    s.setValue("chunk_size", chunkSize);
    s.setValue("large_file_threshold", largeFileThreshold);
    s.setValue("max_file_concurrency", maxFileConcurrency);
    s.setValue("max_chunk_concurrency", maxChunkConcurrency);
    s.setValue("native_tool_enabled", nativeToolEnabled);
    s.setValue("native_tool_path", nativeToolPath);
    s.setValue("native_tool_threads", nativeToolThreads);
    s.setValue("rename_for_move", renameForMove);
    s.setValue("progress_interval_ms", progressIntervalMs);
    s.setValue("progress_byte_step", progressByteStep);
    s.setValue("max_error_details", maxErrorDetails);
    s.endGroup();
}

TransferSettings TransferSettings::fromDefaultStore()
{
    QSettings s;
    TransferSettings t;
    t.load(s);
    return t;
}
