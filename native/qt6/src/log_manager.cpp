#include "log_manager.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QThread>
#include <QCoreApplication>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);
}

LogManager::~LogManager() {
    closeLogFile();
}

void LogManager::installMessageHandler() {
    qInstallMessageHandler(customMessageHandler);
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

bool LogManager::setLogFile(const QString& path) {
    closeLogFile();
    if (path.isEmpty()) {
        return true;
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "[LogManager] Cannot open log file %s: %s\n",
                path.toLocal8Bit().constData(),
                m_file.errorString().toLocal8Bit().constData());
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start ---\n";
    m_ts.flush();
    return true;
}

void LogManager::setMaxEntries(int maxEntries) {
    QMutexLocker locker(&m_mutex);
    m_maxEntries = qMax(1, maxEntries);
    while (m_logs.size() > m_maxEntries) {
        m_logs.removeFirst();
    }
}

void LogManager::addLog(const QString& message, const QString& level) {
    // Stream and flush timer belong to the owning thread
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this, message, level]() {
            addLog(message, level);
        }, Qt::QueuedConnection);
        return;
    }

    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > m_maxEntries) {
            m_logs.removeFirst();
        }
    } // unlock before emitting signals to avoid UI thread deadlocks

    emit logsChanged();
    emit logAdded(logEntry);

    // Write-through to disk log with buffered flushing
    if (m_ts.device()) {
        m_ts << logEntry << '\n';
        scheduleFlush(level);
    }
}

void LogManager::flushPending() {
    if (!m_ts.device()) {
        m_pendingFlush = false;
        return;
    }
    if (m_pendingFlush) {
        m_ts.flush();
        m_pendingFlush = false;
    }
    if (m_flushTimer.isActive()) {
        m_flushTimer.stop();
    }
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::scheduleFlush(const QString& level) {
    m_pendingFlush = true;

    if (shouldFlushImmediately(level)) {
        flushPending();
        return;
    }

    m_flushTimer.start(FLUSH_INTERVAL_MS);
}

void LogManager::closeLogFile() {
    flushPending();
    m_ts.setDevice(nullptr);
    if (m_file.isOpen()) {
        m_file.close();
    }
    m_file.setFileName(QString());
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

    // Queued to avoid re-entrancy when logging from inside a log signal
    QString levelCopy = level;
    QString msgCopy = msg;
    QMetaObject::invokeMethod(&LogManager::instance(), [levelCopy, msgCopy]() {
        LogManager::instance().addLog(msgCopy, levelCopy);
    }, Qt::QueuedConnection);

    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    fprintf(stderr, "[%s] [%s] %s\n",
            timestamp.toLocal8Bit().constData(),
            levelCopy.toLocal8Bit().constData(),
            msgCopy.toLocal8Bit().constData());
    fflush(stderr);

    if (type == QtFatalMsg) {
        abort();
    }
}
