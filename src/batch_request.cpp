#include "batch_request.h"

#include <QObject>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSet>

#include <initializer_list>

static QString firstString(const QJsonObject& o, std::initializer_list<const char*> keys)
{
    for (const char* k : keys) {
        const QJsonValue v = o.value(QLatin1String(k));
        if (v.isString()) return v.toString();
    }
    return QString();
}

bool BatchRequest::fromJson(const QJsonObject& obj, BatchRequest& out, QString* errorOut)
{
    auto fail = [errorOut](const QString& msg) {
        if (errorOut) *errorOut = msg;
        return false;
    };

    BatchRequest req;
    req.batchId = obj.value("batch_id").toString();

    const QString type = obj.value("operation_type").toString("copy");
    if (!operationTypeFromString(type, req.operationType))
        return fail(QObject::tr("Unknown operation_type '%1'").arg(type));

    const QJsonObject wc = obj.value("worker_config").toObject();
    req.workerConfig.maxFileConcurrency = wc.value("max_file_concurrency").toInt(0);
    req.workerConfig.maxChunkConcurrency = wc.value("max_chunk_concurrency").toInt(0);

    const QJsonValue opsVal = obj.value("operations");
    if (!opsVal.isArray()) return fail("operations must be an array");
    const QJsonArray ops = opsVal.toArray();
    req.operations.reserve(ops.size());
    for (int i = 0; i < ops.size(); ++i) {
        if (!ops[i].isObject()) return fail(QObject::tr("operations[%1] is not an object").arg(i));
        const QJsonObject o = ops[i].toObject();
        Operation op;
        op.id = o.value("id").isString() ? o.value("id").toString()
              : o.value("id").isDouble() ? QString::number(o.value("id").toVariant().toLongLong())
              : QString("op-%1").arg(i + 1);
        op.sourcePath = firstString(o, {"source", "source_path"});
        op.destinationPath = firstString(o, {"destination", "destination_path"});
        if (!operationKindFromString(o.value("kind").toString(), op.kind))
            return fail(QObject::tr("operations[%1]: unknown kind '%2'").arg(i).arg(o.value("kind").toString()));
        op.sizeBytes = o.contains("size") ? qint64(o.value("size").toDouble(-1)) : -1;
        op.sequenceId = o.value("sequence_id").toString();
        req.operations.push_back(op);
    }

    out = req;
    return true;
}

bool BatchRequest::fromFile(const QString& path, BatchRequest& out, QString* errorOut)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (errorOut) *errorOut = QObject::tr("Cannot open %1: %2").arg(path, f.errorString());
        return false;
    }
    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorOut) *errorOut = QObject::tr("Invalid request JSON in %1: %2").arg(path, pe.errorString());
        return false;
    }
    return fromJson(doc.object(), out, errorOut);
}

bool BatchRequest::validate(QString* errorOut) const
{
    QSet<QString> seen;
    for (const Operation& op : operations) {
        QString err;
        if (op.id.isEmpty()) err = QObject::tr("operation with empty id");
        else if (seen.contains(op.id)) err = QObject::tr("duplicate operation id '%1'").arg(op.id);
        else if (op.sourcePath.isEmpty()) err = QObject::tr("operation '%1' has no source").arg(op.id);
        else if (op.destinationPath.isEmpty()) err = QObject::tr("operation '%1' has no destination").arg(op.id);
        if (!err.isEmpty()) {
            if (errorOut) *errorOut = err;
            return false;
        }
        seen.insert(op.id);
    }
    if (workerConfig.maxFileConcurrency < 0 || workerConfig.maxChunkConcurrency < 0) {
        if (errorOut) *errorOut = QObject::tr("worker_config values must not be negative");
        return false;
    }
    return true;
}

TransferSettings BatchRequest::effectiveSettings(const TransferSettings& base) const
{
    TransferSettings s = base;
    if (workerConfig.maxFileConcurrency > 0) s.maxFileConcurrency = workerConfig.maxFileConcurrency;
    if (workerConfig.maxChunkConcurrency > 0) s.maxChunkConcurrency = workerConfig.maxChunkConcurrency;
    return s;
}
