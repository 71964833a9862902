#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QFile>
#include <QMutex>
#include <QObject>
#include <QStringList>
#include <QTextStream>
#include <QTimer>

/**
 * Application log. Keeps the most recent entries in memory for the log pane
 * and appends every entry to dropfiles.log next to the executable.
 *
 * Entries look like "[hh:mm:ss.zzz] [LEVEL] message".
 */
class LogManager : public QObject {
    Q_OBJECT
    Q_PROPERTY(QStringList logs READ logs NOTIFY logsChanged)

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    QStringList logs() const;
    QString logFilePath() const { return m_file.fileName(); }

    Q_INVOKABLE void addLog(const QString& message, const QString& level = "INFO");
    Q_INVOKABLE void clear();

    static constexpr int MAX_LOGS = 1000;

signals:
    void logsChanged();
    void logAdded(const QString& entry);

private:
    explicit LogManager(QObject* parent = nullptr);
    void writeEntry(const QString& entry, const QString& level);
    void flushPending();

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    static constexpr int FLUSH_INTERVAL_MS = 250;
};

// Routes qDebug/qInfo/qWarning/qCritical into LogManager and stderr
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
