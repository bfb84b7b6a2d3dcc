#pragma once
#include <QString>
#include <QVector>
#include <QJsonObject>

#include "transfer_settings.h"
#include "transfer_types.h"

// Per-request overrides; 0 keeps the configured default
struct WorkerConfig {
    int maxFileConcurrency = 0;
    int maxChunkConcurrency = 0;
};

// A batch-apply request as produced by the mapping engine and the confirm
// action:
// { "batch_id"?: str, "operation_type": "copy"|"move",
//   "worker_config"?: { "max_file_concurrency": n, "max_chunk_concurrency": n },
//   "operations": [ { "id"?, "source", "destination", "kind"?, "size"?, "sequence_id"? } ] }
struct BatchRequest {
    QString batchId; // generated by the coordinator when empty
    QVector<Operation> operations;
    OperationType operationType = OperationType::Copy;
    WorkerConfig workerConfig;

    static bool fromJson(const QJsonObject& obj, BatchRequest& out, QString* errorOut = nullptr);
    static bool fromFile(const QString& path, BatchRequest& out, QString* errorOut = nullptr);

    // Operation ids must be unique and every operation needs both paths
    bool validate(QString* errorOut = nullptr) const;

    TransferSettings effectiveSettings(const TransferSettings& base) const;
};
