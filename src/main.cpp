#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QJsonDocument>
#include <QMutex>
#include <QMutexLocker>
#include <QSettings>
#include <cstdio>

#include "batch_coordinator.h"
#include "batch_request.h"
#include "cancellation_registry.h"
#include "log_manager.h"
#include "progress_reporter.h"
#include "transfer_settings.h"

namespace {

// Process exit codes
enum ExitCode { ExitCompleted = 0, ExitFailed = 1, ExitCancelled = 2, ExitInvalid = 3 };

// One compact JSON object per line on stdout: progress events, then the
// summary tagged with "event": "summary"
class JsonLinesSink : public ProgressSink {
public:
    void publish(const ProgressEvent& event) override {
        QJsonObject o = event.toJson();
        o.insert("event", "progress");
        write(o);
    }
    void finished(const BatchSummary& summary) override {
        QJsonObject o = summary.toJson();
        o.insert("event", "summary");
        write(o);
    }

private:
    void write(const QJsonObject& o) {
        const QByteArray line = QJsonDocument(o).toJson(QJsonDocument::Compact);
        QMutexLocker lk(&m_mutex);
        fwrite(line.constData(), 1, size_t(line.size()), stdout);
        fputc('\n', stdout);
        fflush(stdout);
    }
    QMutex m_mutex;
};

int exitCodeFor(BatchState state)
{
    switch (state) {
        case BatchState::Completed: return ExitCompleted;
        case BatchState::Cancelled: return ExitCancelled;
        default: return ExitFailed;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Identify app for QSettings
    QCoreApplication::setOrganizationName("KAsset");
    QCoreApplication::setOrganizationDomain("kasset.local");
    QCoreApplication::setApplicationName("ktransfer");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Apply a batch of copy/move operations with bounded concurrency.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("request", "Batch-apply request JSON file.");

    QCommandLineOption settingsOpt("settings", "Load engine settings from an INI file.", "ini");
    QCommandLineOption filesOpt("files", "Maximum files transferred concurrently.", "n");
    QCommandLineOption chunksOpt("chunks", "Maximum chunk streams per file.", "n");
    QCommandLineOption chunkSizeOpt("chunk-size", "Chunk size in bytes.", "bytes");
    QCommandLineOption nativeOpt("native", "Use the platform bulk-copy tool when present.");
    QCommandLineOption noNativeOpt("no-native", "Never use the platform bulk-copy tool.");
    QCommandLineOption logFileOpt("log-file", "Log file path (default: ktransfer.log).", "path");
    QCommandLineOption logLevelOpt("log-level", "Minimum log level: DEBUG, INFO, WARN, ERROR.", "level");
    QCommandLineOption batchIdOpt("batch-id", "Override the request's batch id.", "id");
    QCommandLineOption moveOpt("move", "Force operation_type to move.");
    parser.addOptions({settingsOpt, filesOpt, chunksOpt, chunkSizeOpt, nativeOpt, noNativeOpt,
                       logFileOpt, logLevelOpt, batchIdOpt, moveOpt});
    parser.process(app);

    TransferSettings settings;
    QString logLevel = "INFO";
    if (parser.isSet(settingsOpt)) {
        QSettings ini(parser.value(settingsOpt), QSettings::IniFormat);
        settings.load(ini);
        logLevel = ini.value("log/level", logLevel).toString();
    } else {
        settings = TransferSettings::fromDefaultStore();
        logLevel = QSettings().value("log/level", logLevel).toString();
    }
    if (parser.isSet(logLevelOpt)) logLevel = parser.value(logLevelOpt);

    const QString logFile = parser.isSet(logFileOpt)
        ? parser.value(logFileOpt)
        : QDir::current().filePath("ktransfer.log");
    LogManager::instance().install(logFile, logLevel);

    bool ok = true;
    if (parser.isSet(filesOpt)) settings.maxFileConcurrency = parser.value(filesOpt).toInt(&ok);
    if (ok && parser.isSet(chunksOpt)) settings.maxChunkConcurrency = parser.value(chunksOpt).toInt(&ok);
    if (ok && parser.isSet(chunkSizeOpt)) settings.chunkSize = parser.value(chunkSizeOpt).toLongLong(&ok);
    if (!ok) {
        qCritical() << "[Main] Numeric option expected";
        return ExitInvalid;
    }
    if (parser.isSet(nativeOpt)) settings.nativeToolEnabled = true;
    if (parser.isSet(noNativeOpt)) settings.nativeToolEnabled = false;

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        qCritical() << "[Main] Expected exactly one request file";
        parser.showHelp(ExitInvalid);
    }

    BatchRequest request;
    QString err;
    if (!BatchRequest::fromFile(args.first(), request, &err)) {
        qCritical() << "[Main]" << err;
        return ExitInvalid;
    }
    if (parser.isSet(batchIdOpt)) request.batchId = parser.value(batchIdOpt);
    if (parser.isSet(moveOpt)) request.operationType = OperationType::Move;

    CancellationRegistry registry;
    BatchCoordinator coordinator(registry, settings);
    JsonLinesSink sink;
    coordinator.setProgressSink(&sink);

    int exitCode = ExitInvalid;
    QObject::connect(&coordinator, &BatchCoordinator::batchFinished, &app,
                     [&exitCode](const QString&, const BatchSummary& summary) {
                         exitCode = exitCodeFor(summary.state);
                         QCoreApplication::quit();
                     });

    const QString batchId = coordinator.start(request, &err);
    if (batchId.isEmpty()) {
        qCritical() << "[Main] Batch rejected:" << err;
        return ExitInvalid;
    }

    app.exec();
    LogManager::instance().flush();
    return exitCode;
}
