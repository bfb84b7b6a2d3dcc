#include "log_manager.h"
#include <QDebug>
#include <QMutexLocker>
#include <QCoreApplication>
#include <QThread>
#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent)
{
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);
}

LogManager::~LogManager()
{
    flush();
    qInstallMessageHandler(nullptr);
}

bool LogManager::install(const QString& filePath, const QString& minLevel)
{
    setMinimumLevel(minLevel);
    {
        QMutexLocker locker(&m_mutex);
        if (m_file.isOpen()) {
            m_ts.flush();
            m_ts.setDevice(nullptr);
            m_file.close();
        }
        m_file.setFileName(filePath);
        if (m_file.open(QIODevice::Append | QIODevice::Text)) {
            m_ts.setDevice(&m_file);
            m_ts << "\n--- session start ---\n";
            m_ts.flush();
        }
    }
    qInstallMessageHandler(customMessageHandler);
    if (!m_file.isOpen()) {
        qWarning() << "[Log] Cannot open log file" << filePath << "- logging to stderr only";
        return false;
    }
    return true;
}

QString LogManager::filePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_file.fileName();
}

int LogManager::levelRank(const QString& level)
{
    const QString upper = level.toUpper();
    if (upper == "DEBUG") return 0;
    if (upper == "WARN" || upper == "WARNING") return 2;
    if (upper == "ERROR") return 3;
    if (upper == "FATAL") return 4;
    return 1;
}

void LogManager::setMinimumLevel(const QString& level)
{
    m_minRank.store(levelRank(level));
}

QString LogManager::minimumLevel() const
{
    static const char* names[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    return QString::fromLatin1(names[m_minRank.load()]);
}

bool LogManager::isEnabled(const QString& level) const
{
    return levelRank(level) >= m_minRank.load();
}

QStringList LogManager::logs() const
{
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

void LogManager::addLog(const QString& message, const QString& level)
{
    if (!isEnabled(level)) return;

    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }

        // Write-through to disk log with buffered flushing
        if (m_ts.device()) {
            m_ts << logEntry << '\n';
            m_pendingFlush = true;
        }
    } // unlock before emitting to avoid re-entrant logging deadlocks

    emit logAdded(logEntry);
    scheduleFlush(level);
}

void LogManager::flush()
{
    flushPending();
}

void LogManager::flushPending()
{
    QMutexLocker locker(&m_mutex);
    if (!m_ts.device()) {
        m_pendingFlush = false;
        return;
    }
    if (m_pendingFlush) {
        m_ts.flush();
        m_pendingFlush = false;
    }
}

bool LogManager::shouldFlushImmediately(const QString& level) const
{
    return levelRank(level) >= levelRank("WARN");
}

void LogManager::scheduleFlush(const QString& level)
{
    if (shouldFlushImmediately(level)) {
        flushPending();
        return;
    }
    // The timer belongs to the logger's thread; start it there
    if (QThread::currentThread() == thread()) {
        if (!m_flushTimer.isActive()) m_flushTimer.start(FLUSH_INTERVAL_MS);
    } else {
        QMetaObject::invokeMethod(this, [this]() {
            if (!m_flushTimer.isActive()) m_flushTimer.start(FLUSH_INTERVAL_MS);
        }, Qt::QueuedConnection);
    }
}

void LogManager::clear()
{
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    LogManager& log = LogManager::instance();
    if (!log.isEnabled(level)) return;

    // Worker threads log directly; the ring buffer and stream are mutex-guarded
    log.addLog(msg, level);

    // Also output to stderr; stdout carries the machine-readable event stream
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    fprintf(stderr, "[%s] [%s] %s\n",
            timestamp.toLocal8Bit().constData(),
            level.toLocal8Bit().constData(),
            msg.toLocal8Bit().constData());
    fflush(stderr);

    if (type == QtFatalMsg) {
        log.flush();
        abort();
    }
}
