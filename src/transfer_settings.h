#pragma once
#include <QString>
#include <QtGlobal>

class QSettings;

// Engine tuning knobs. Defaults are starting points tuned for local disks;
// network targets usually want larger chunks and more chunk streams.
struct TransferSettings {
    qint64 chunkSize = 1024 * 1024;
    qint64 largeFileThreshold = 10 * 1024 * 1024;
    int maxFileConcurrency = 4;
    int maxChunkConcurrency = 4;
#ifdef Q_OS_WIN
    bool nativeToolEnabled = true;
#else
    bool nativeToolEnabled = false;
#endif
    QString nativeToolPath;      // empty = resolve on PATH
    int nativeToolThreads = 32;
    bool renameForMove = true;
    int progressIntervalMs = 100;
    qint64 progressByteStep = 8 * 1024 * 1024;
    int maxErrorDetails = 20;

    static constexpr qint64 MIN_CHUNK_SIZE = 4 * 1024;
    static constexpr qint64 MAX_CHUNK_SIZE = 64 * 1024 * 1024;
    static constexpr int MAX_CONCURRENCY = 64;
    static constexpr int STREAM_GUIDELINE = 32;

    bool validate(QString* errorOut = nullptr) const;

    void load(QSettings& s);
    void save(QSettings& s) const;

    // Application-scoped store (organization/application set in main)
    static TransferSettings fromDefaultStore();
};
