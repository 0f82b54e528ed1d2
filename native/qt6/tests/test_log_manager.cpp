#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QSignalSpy>
#include <QThread>
#include "../src/log_manager.h"

class TestLogManager : public QObject {
    Q_OBJECT
private slots:
    void init();
    void testRingBuffer();
    void testWritesLogFile();
    void testAddFromWorkerThread();
};

void TestLogManager::init()
{
    LogManager::instance().setLogFile(QString());
    LogManager::instance().setMaxEntries(1000);
    LogManager::instance().clear();
}

void TestLogManager::testRingBuffer()
{
    auto& log = LogManager::instance();
    log.setMaxEntries(3);
    for (int i = 0; i < 5; ++i) {
        log.addLog(QString("entry %1").arg(i));
    }
    const QStringList logs = log.logs();
    QCOMPARE(logs.size(), 3);
    QVERIFY(logs.first().endsWith("entry 2"));
    QVERIFY(logs.last().contains("[INFO] entry 4"));
}

void TestLogManager::testWritesLogFile()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString path = tmp.filePath("logs/kworkbench.log");

    auto& log = LogManager::instance();
    QVERIFY(log.setLogFile(path));
    // Errors are flushed right away
    log.addLog("[DropHandler] Opening dropped locations failed", "ERROR");

    QFile f(path);
    QVERIFY(f.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString content = QString::fromUtf8(f.readAll());
    QVERIFY(content.contains("--- session start ---"));
    QVERIFY(content.contains("[ERROR] [DropHandler] Opening dropped locations failed"));
    log.setLogFile(QString());
}

void TestLogManager::testAddFromWorkerThread()
{
    auto& log = LogManager::instance();
    QSignalSpy added(&log, &LogManager::logAdded);

    QThread* worker = QThread::create([] {
        LogManager::instance().addLog("from worker", "DEBUG");
    });
    worker->start();
    QVERIFY(worker->wait(2000));
    delete worker;

    QTRY_COMPARE(added.count(), 1);
    QVERIFY(log.logs().last().contains("[DEBUG] from worker"));
}

QTEST_GUILESS_MAIN(TestLogManager)
#include "test_log_manager.moc"
