#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QFile>
#include <QTextStream>
#include <QTimer>
#include <atomic>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    // Opens the persistent log (appending) and routes qDebug/qInfo/qWarning
    // through customMessageHandler. Messages below minLevel are dropped.
    bool install(const QString& filePath, const QString& minLevel = "INFO");

    QString filePath() const;
    void setMinimumLevel(const QString& level);
    QString minimumLevel() const;
    bool isEnabled(const QString& level) const;

    QStringList logs() const;

    void addLog(const QString& message, const QString& level = "INFO");
    void clear();
    void flush();

    // DEBUG < INFO < WARN < ERROR < FATAL; unknown levels rank as INFO
    static int levelRank(const QString& level);

    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_INTERVAL_MS = 250;

signals:
    void logAdded(const QString& message);

private:
    explicit LogManager(QObject* parent = nullptr);
    void flushPending();
    void scheduleFlush(const QString& level);
    bool shouldFlushImmediately(const QString& level) const;

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    std::atomic<int> m_minRank{1};
};

// Custom message handler for qDebug/qInfo/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
