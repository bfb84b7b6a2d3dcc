#include <QtTest>
#include <QTemporaryDir>
#include <QJsonDocument>
#include <QFile>
#include "../src/batch_request.h"

namespace {

QJsonObject parse(const QByteArray& json)
{
    return QJsonDocument::fromJson(json).object();
}

} // namespace

class TestBatchRequest : public QObject {
    Q_OBJECT
private slots:
    void testParseFullRequest();
    void testDefaults();
    void testRejectsUnknownType();
    void testRejectsBadOperations();
    void testValidate();
    void testEffectiveSettings();
    void testFromFile();
};

void TestBatchRequest::testParseFullRequest()
{
    BatchRequest req;
    QString err;
    QVERIFY2(BatchRequest::fromJson(parse(R"({
        "batch_id": "B1",
        "operation_type": "move",
        "worker_config": { "max_file_concurrency": 8, "max_chunk_concurrency": 2 },
        "operations": [
            { "id": "a", "source": "/in/a.0001.exr", "destination": "/out/a.0001.exr",
              "kind": "sequence_member", "size": 1024, "sequence_id": "a" },
            { "id": 7, "source_path": "/in/b.mov", "destination_path": "/out/b.mov" }
        ]
    })"), req, &err), qPrintable(err));

    QCOMPARE(req.batchId, QString("B1"));
    QCOMPARE(req.operationType, OperationType::Move);
    QCOMPARE(req.workerConfig.maxFileConcurrency, 8);
    QCOMPARE(req.workerConfig.maxChunkConcurrency, 2);
    QCOMPARE(req.operations.size(), 2);
    QCOMPARE(req.operations[0].kind, OperationKind::SequenceMember);
    QCOMPARE(req.operations[0].sizeBytes, qint64(1024));
    QCOMPARE(req.operations[0].sequenceId, QString("a"));
    QCOMPARE(req.operations[1].id, QString("7"));
    QCOMPARE(req.operations[1].sourcePath, QString("/in/b.mov"));
    QCOMPARE(req.operations[1].kind, OperationKind::File);
    QCOMPARE(req.operations[1].sizeBytes, qint64(-1));
}

void TestBatchRequest::testDefaults()
{
    BatchRequest req;
    QVERIFY(BatchRequest::fromJson(parse(R"({ "operations": [ { "source": "s", "destination": "d" } ] })"), req));
    QVERIFY(req.batchId.isEmpty());
    QCOMPARE(req.operationType, OperationType::Copy);
    QCOMPARE(req.operations[0].id, QString("op-1"));
    QCOMPARE(req.workerConfig.maxFileConcurrency, 0);

    // An empty batch is valid
    QVERIFY(BatchRequest::fromJson(parse(R"({ "operations": [] })"), req));
    QVERIFY(req.operations.isEmpty());
    QVERIFY(req.validate());
}

void TestBatchRequest::testRejectsUnknownType()
{
    BatchRequest req;
    QString err;
    QVERIFY(!BatchRequest::fromJson(parse(R"({ "operation_type": "link", "operations": [] })"), req, &err));
    QVERIFY(err.contains("link"));
}

void TestBatchRequest::testRejectsBadOperations()
{
    BatchRequest req;
    QString err;
    QVERIFY(!BatchRequest::fromJson(parse(R"({ "operations": {} })"), req, &err));
    QVERIFY(!BatchRequest::fromJson(parse(R"({ "operations": [ 3 ] })"), req, &err));
    QVERIFY(!BatchRequest::fromJson(parse(R"({ "operations": [ { "source": "s", "destination": "d", "kind": "dir" } ] })"), req, &err));
    QVERIFY(err.contains("dir"));
}

void TestBatchRequest::testValidate()
{
    BatchRequest req;
    QVERIFY(BatchRequest::fromJson(parse(R"({ "operations": [
        { "id": "x", "source": "s1", "destination": "d1" },
        { "id": "x", "source": "s2", "destination": "d2" } ] })"), req));
    QString err;
    QVERIFY(!req.validate(&err));
    QVERIFY(err.contains("duplicate"));

    req.operations[1].id = "y";
    QVERIFY(req.validate());
    req.operations[1].destinationPath.clear();
    QVERIFY(!req.validate(&err));

    req.operations[1].destinationPath = "d2";
    req.workerConfig.maxChunkConcurrency = -1;
    QVERIFY(!req.validate(&err));
}

void TestBatchRequest::testEffectiveSettings()
{
    TransferSettings base;
    base.maxFileConcurrency = 4;
    base.maxChunkConcurrency = 4;
    BatchRequest req;
    req.workerConfig.maxFileConcurrency = 16;
    TransferSettings s = req.effectiveSettings(base);
    QCOMPARE(s.maxFileConcurrency, 16);
    QCOMPARE(s.maxChunkConcurrency, 4);
    QCOMPARE(s.chunkSize, base.chunkSize);
}

void TestBatchRequest::testFromFile()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("req.json");
    {
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(R"({ "batch_id": "F", "operations": [ { "source": "a", "destination": "b" } ] })");
    }
    BatchRequest req;
    QString err;
    QVERIFY2(BatchRequest::fromFile(path, req, &err), qPrintable(err));
    QCOMPARE(req.batchId, QString("F"));

    {
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
        f.write("{ not json");
    }
    QVERIFY(!BatchRequest::fromFile(path, req, &err));
    QVERIFY(!BatchRequest::fromFile(dir.filePath("missing.json"), req, &err));
    QVERIFY(err.contains("Cannot open"));
}

QTEST_APPLESS_MAIN(TestBatchRequest)
#include "test_batch_request.moc"
