#include "log_manager.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QMetaObject>
#include <QMutexLocker>
#include <cstdio>
#include <cstdlib>

namespace {

bool isUrgent(const QString& level)
{
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

QString levelName(QtMsgType type)
{
    switch (type) {
        case QtDebugMsg: return QStringLiteral("DEBUG");
        case QtInfoMsg: return QStringLiteral("INFO");
        case QtWarningMsg: return QStringLiteral("WARN");
        case QtCriticalMsg: return QStringLiteral("ERROR");
        case QtFatalMsg: return QStringLiteral("FATAL");
    }
    return QStringLiteral("INFO");
}

} // namespace

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);

    m_file.setFileName(QCoreApplication::applicationDirPath() + "/dropfiles.log");
    if (m_file.open(QIODevice::Append | QIODevice::Text)) {
        m_ts.setDevice(&m_file);
        m_ts << "\n--- session start ---\n";
        m_ts.flush();
    } else {
        fprintf(stderr, "[LogManager] Cannot open %s, file logging disabled\n",
                m_file.fileName().toLocal8Bit().constData());
    }
}

LogManager::~LogManager() {
    flushPending();
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

void LogManager::addLog(const QString& message, const QString& level) {
    const QString entry = QString("[%1] [%2] %3")
                              .arg(QDateTime::currentDateTime().toString("hh:mm:ss.zzz"), level.toUpper(), message);
    {
        QMutexLocker locker(&m_mutex);
        m_logs.append(entry);
        while (m_logs.size() > MAX_LOGS) m_logs.removeFirst();
    } // signals go out unlocked; slots may call logs()

    emit logsChanged();
    emit logAdded(entry);
    writeEntry(entry, level);
}

void LogManager::writeEntry(const QString& entry, const QString& level) {
    if (!m_ts.device()) return;

    m_ts << entry << '\n';
    m_pendingFlush = true;
    if (isUrgent(level)) {
        flushPending();
    } else if (!m_flushTimer.isActive()) {
        m_flushTimer.start();
    }
}

void LogManager::flushPending() {
    if (m_flushTimer.isActive()) {
        m_flushTimer.stop();
    }
    if (m_pendingFlush && m_ts.device()) {
        m_ts.flush();
    }
    m_pendingFlush = false;
}

void LogManager::clear() {
    {
        QMutexLocker locker(&m_mutex);
        m_logs.clear();
    }
    emit logsChanged();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    const QString level = levelName(type);

    // Queued: messages can come from worker threads or from inside slots connected to logAdded
    QMetaObject::invokeMethod(&LogManager::instance(), [level, msg]() {
        LogManager::instance().addLog(msg, level);
    }, Qt::QueuedConnection);

    fprintf(stderr, "[%s] [%s] %s\n",
            QDateTime::currentDateTime().toString("hh:mm:ss.zzz").toLocal8Bit().constData(),
            level.toLocal8Bit().constData(),
            msg.toLocal8Bit().constData());
    fflush(stderr);

    if (type == QtFatalMsg) {
        abort();
    }
}
