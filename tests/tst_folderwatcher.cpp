#include <QtTest>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QPointer>
#include <QSettings>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTimer>

#ifndef Q_MOC_RUN
import skylift.services.watch_backend;
import skylift.core.folderwatcher;
#endif

#include "mocks/fakewatchbackend.h"

class TestFolderWatcher : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir* m_dir = nullptr;
    FolderWatcher* m_watcher = nullptr;
    QPointer<FakeWatchBackend> m_backend;

    QString writeFile(const QString& name, const QByteArray& content = QByteArray(1024, 'x'))
    {
        const QString path = QDir::cleanPath(m_dir->filePath(name));
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) return QString();
        file.write(content);
        return path;
    }

    static bool setModified(const QString& path, qint64 msecsSinceEpoch)
    {
        QFile file(path);
        if (!file.open(QIODevice::ReadWrite)) return false;
        return file.setFileTime(QDateTime::fromMSecsSinceEpoch(msecsSinceEpoch), QFileDevice::FileModificationTime);
    }

    void useFakeBackend(bool refuseStart = false)
    {
        m_watcher->setBackendFactory([this, refuseStart]() -> WatchBackend* {
            auto* backend = new FakeWatchBackend(refuseStart);
            m_backend = backend;
            return backend;
        });
    }

private slots:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
        QCoreApplication::setOrganizationName("Genyleap");
        QCoreApplication::setApplicationName("SkyliftWatcherTest");
    }

    void init()
    {
        QSettings().clear();
        m_dir = new QTemporaryDir;
        QVERIFY(m_dir->isValid());
        m_watcher = new FolderWatcher;
        m_watcher->setLatencyMs(10);
        m_watcher->setReadinessIntervalMs(50);
        m_watcher->setReadinessMaxAttempts(10);
        useFakeBackend();
    }

    void cleanup()
    {
        delete m_watcher;
        m_watcher = nullptr;
        delete m_dir;
        m_dir = nullptr;
    }

    void startAndStop()
    {
        QSignalSpy watchingSpy(m_watcher, &FolderWatcher::watchingChanged);
        QVERIFY(m_watcher->start(m_dir->path()));
        QVERIFY(m_watcher->isWatching());
        QCOMPARE(m_watcher->folder(), QDir::cleanPath(m_dir->path()));
        QCOMPARE(m_watcher->backendName(), QString("fake"));
        QVERIFY(m_backend && m_backend->isRunning());
        QCOMPARE(watchingSpy.count(), 1);

        m_watcher->stop();
        QVERIFY(!m_watcher->isWatching());
        QCOMPARE(watchingSpy.count(), 2);
        QTRY_VERIFY(m_backend.isNull());
    }

    void missingFolderIsAnError()
    {
        QSignalSpy errorSpy(m_watcher, &FolderWatcher::errorOccurred);
        QVERIFY(!m_watcher->start(m_dir->filePath("nowhere")));
        QVERIFY(!m_watcher->isWatching());
        QCOMPARE(errorSpy.count(), 1);
    }

    void fallsBackToPolling()
    {
        useFakeBackend(true);
        QVERIFY(m_watcher->start(m_dir->path()));
        QCOMPARE(m_watcher->backendName(), QString("polling"));
    }

    void onlyNewFilesInTheFolderAreCandidates()
    {
        m_watcher->setAutoCheckReadiness(false);
        QVERIFY(m_watcher->start(m_dir->path()));
        QSignalSpy candidateSpy(m_watcher, &FolderWatcher::candidateDetected);

        QVERIFY(QDir(m_dir->path()).mkpath("sub"));
        const QString photo = writeFile("photo.jpg");
        const QString renamed = writeFile("renamed.jpg");
        const QString modified = writeFile("modified.jpg");
        const QString hidden = writeFile(".hidden.jpg");
        const QString apple = writeFile("._photo.jpg");
        const QString partial = writeFile("photo.jpg.tmp");
        const QString nested = writeFile("sub/nested.jpg");
        const QString gone = m_dir->filePath("gone.jpg");

        m_backend->emitCreated(photo);
        m_backend->emitCreated(photo);
        m_backend->emitRenamedIn(renamed);
        m_backend->emitModified(modified);
        m_backend->emitCreated(hidden);
        m_backend->emitCreated(apple);
        m_backend->emitCreated(partial);
        m_backend->emitCreated(nested);
        m_backend->emitCreated(gone);
        m_backend->emitRemoved(photo);
        m_backend->emitDirectoryCreated(m_dir->filePath("sub"));

        QTRY_COMPARE(candidateSpy.count(), 2);
        QTest::qWait(50);
        QCOMPARE(candidateSpy.count(), 2);
        QCOMPARE(candidateSpy.at(0).at(0).toString(), photo);
        QCOMPARE(candidateSpy.at(1).at(0).toString(), renamed);
        QVERIFY(m_watcher->lastEventCursor() > 0);
    }

    void growingFileIsReleasedOnceStable()
    {
        QVERIFY(m_watcher->start(m_dir->path()));
        QSignalSpy readySpy(m_watcher, &FolderWatcher::fileReady);

        const QString photo = writeFile("photo.jpg", QByteArray(1, 'x'));
        const QString sibling = writeFile("photo.jpg.tmp", QByteArray(1, 'x'));
        const qint64 step = 200 * 1024;
        int growth = 0;
        qint64 sizeWhenReleased = -1;
        connect(m_watcher, &FolderWatcher::fileReady, this, [&](const QString& path) {
            sizeWhenReleased = QFileInfo(path).size();
        });

        QTimer grower;
        grower.setInterval(20);
        connect(&grower, &QTimer::timeout, this, [&]() {
            QFile file(photo);
            if (file.open(QIODevice::Append)) file.write(QByteArray(step, 'y'));
            if (++growth == 10) grower.stop();
        });
        grower.start();

        m_backend->emitCreated(photo);
        m_backend->emitCreated(sibling);

        QTRY_COMPARE_WITH_TIMEOUT(readySpy.count(), 1, 5000);
        QCOMPARE(growth, 10);
        QCOMPARE(sizeWhenReleased, 1 + 10 * step);
        QCOMPARE(readySpy.at(0).at(0).toString(), photo);
        QCOMPARE(readySpy.at(0).at(1).toBool(), false);

        QTest::qWait(200);
        QCOMPARE(readySpy.count(), 1);
        QCOMPARE(m_watcher->pendingReadinessCount(), 0);
    }

    void unsettledFileIsForcedAfterMaxAttempts()
    {
        m_watcher->setReadinessIntervalMs(30);
        m_watcher->setReadinessMaxAttempts(4);
        QVERIFY(m_watcher->start(m_dir->path()));
        QSignalSpy readySpy(m_watcher, &FolderWatcher::fileReady);

        const QString video = writeFile("endless.jpg");
        QTimer grower;
        grower.setInterval(5);
        connect(&grower, &QTimer::timeout, this, [&]() {
            QFile file(video);
            if (file.open(QIODevice::Append)) file.write(QByteArray(64, 'z'));
        });
        grower.start();

        m_backend->emitCreated(video);
        QTRY_COMPARE_WITH_TIMEOUT(readySpy.count(), 1, 5000);
        grower.stop();
        QCOMPARE(readySpy.at(0).at(1).toBool(), true);
    }

    void vanishedFileIsDiscarded()
    {
        QVERIFY(m_watcher->start(m_dir->path()));
        QSignalSpy readySpy(m_watcher, &FolderWatcher::fileReady);
        QSignalSpy discardSpy(m_watcher, &FolderWatcher::fileDiscarded);

        const QString path = writeFile("brief.jpg");
        connect(m_watcher, &FolderWatcher::candidateDetected, this, [](const QString& p) { QFile::remove(p); });
        m_backend->emitCreated(path);

        QTRY_COMPARE(discardSpy.count(), 1);
        QCOMPARE(discardSpy.at(0).at(0).toString(), path);
        QCOMPARE(discardSpy.at(0).at(1).toString(), QString("disappeared"));
        QCOMPARE(readySpy.count(), 0);
    }

    void readinessChecksAreNotDuplicated()
    {
        m_watcher->setAutoCheckReadiness(false);
        QVERIFY(m_watcher->start(m_dir->path()));
        const QString path = writeFile("once.jpg");
        QSignalSpy readySpy(m_watcher, &FolderWatcher::fileReady);

        QVERIFY(m_watcher->checkReadiness(path));
        QVERIFY(!m_watcher->checkReadiness(path));
        QCOMPARE(m_watcher->pendingReadinessCount(), 1);

        QTRY_COMPARE(readySpy.count(), 1);
        QTest::qWait(150);
        QCOMPARE(readySpy.count(), 1);
        QCOMPARE(m_watcher->pendingReadinessCount(), 0);
        QVERIFY(m_watcher->checkReadiness(path));
    }

    void stopCancelsPendingChecks()
    {
        m_watcher->setReadinessIntervalMs(100);
        QVERIFY(m_watcher->start(m_dir->path()));
        QSignalSpy readySpy(m_watcher, &FolderWatcher::fileReady);
        QSignalSpy discardSpy(m_watcher, &FolderWatcher::fileDiscarded);

        const QString path = writeFile("late.jpg");
        m_backend->emitCreated(path);
        QTRY_COMPARE(m_watcher->pendingReadinessCount(), 1);

        m_watcher->stop();
        QCOMPARE(m_watcher->pendingReadinessCount(), 0);
        QTest::qWait(400);
        QCOMPARE(readySpy.count(), 0);
        QCOMPARE(discardSpy.count(), 0);
    }

    void cursorSurvivesRestart()
    {
        const qint64 before = QDateTime::currentMSecsSinceEpoch();
        const QString old = writeFile("old.jpg");
        QVERIFY(setModified(old, before - 60000));

        m_watcher->setAutoCheckReadiness(false);
        QSignalSpy candidateSpy(m_watcher, &FolderWatcher::candidateDetected);

        // First session: no saved cursor, existing files are left alone.
        QVERIFY(m_watcher->start(m_dir->path()));
        QTest::qWait(50);
        QCOMPARE(candidateSpy.count(), 0);
        const quint64 cursor = FolderWatcher::savedCursor(m_dir->path());
        QVERIFY(cursor >= quint64(before));
        m_watcher->stop();

        // Created while nobody was watching.
        QTest::qWait(20);
        const QString missed = writeFile("missed.jpg");

        QVERIFY(m_watcher->start(m_dir->path()));
        QTRY_COMPARE(candidateSpy.count(), 1);
        QCOMPARE(candidateSpy.at(0).at(0).toString(), missed);
        QVERIFY(m_watcher->lastEventCursor() > cursor);
        QVERIFY(m_watcher->lastEventCursor() <= quint64(QDateTime::currentMSecsSinceEpoch()));
        m_watcher->stop();

        // Starting from now skips the catch-up.
        candidateSpy.clear();
        QVERIFY(setModified(missed, QDateTime::currentMSecsSinceEpoch() + 60000));
        QVERIFY(m_watcher->start(m_dir->path(), true));
        QTest::qWait(50);
        QCOMPARE(candidateSpy.count(), 0);
        m_watcher->stop();

        FolderWatcher::resetCursor(m_dir->path());
        QCOMPARE(FolderWatcher::savedCursor(m_dir->path()), quint64(0));
    }

    void fileMovedInWhileStoppedIsCaughtUp()
    {
        QVERIFY(QDir(m_dir->path()).mkdir("card"));
        const QString source = writeFile("card/IMG_0042.jpg");
        QVERIFY(setModified(source, QDateTime::currentMSecsSinceEpoch() - 24 * 3600 * 1000));

        m_watcher->setAutoCheckReadiness(false);
        QSignalSpy candidateSpy(m_watcher, &FolderWatcher::candidateDetected);
        QVERIFY(m_watcher->start(m_dir->path()));
        QTest::qWait(20);
        m_watcher->stop();

        // A move keeps the old modification time.
        QTest::qWait(20);
        const QString moved = QDir::cleanPath(m_dir->filePath("IMG_0042.jpg"));
        QVERIFY(QFile::rename(source, moved));

        QVERIFY(m_watcher->start(m_dir->path()));
        QTRY_COMPARE(candidateSpy.count(), 1);
        QCOMPARE(candidateSpy.at(0).at(0).toString(), moved);
        m_watcher->stop();

        // Handled once; the next restart does not replay it.
        candidateSpy.clear();
        QVERIFY(m_watcher->start(m_dir->path()));
        QTest::qWait(50);
        QCOMPARE(candidateSpy.count(), 0);
    }

    void futureTimestampDoesNotOutrunTheClock()
    {
        QVERIFY(m_watcher->start(m_dir->path()));
        QSignalSpy readySpy(m_watcher, &FolderWatcher::fileReady);
        QSignalSpy candidateSpy(m_watcher, &FolderWatcher::candidateDetected);

        const QString ahead = writeFile("camera_clock_ahead.jpg");
        QVERIFY(setModified(ahead, QDateTime::currentMSecsSinceEpoch() + 3600 * 1000));
        m_backend->emitCreated(ahead);
        QTRY_COMPARE(readySpy.count(), 1);

        const quint64 now = quint64(QDateTime::currentMSecsSinceEpoch());
        QVERIFY(m_watcher->lastEventCursor() <= now);
        QVERIFY(FolderWatcher::savedCursor(m_dir->path()) <= now);
        m_watcher->stop();

        QTest::qWait(20);
        const QString next = writeFile("next.jpg");
        candidateSpy.clear();
        QVERIFY(m_watcher->start(m_dir->path()));
        QTRY_COMPARE(candidateSpy.count(), 1);
        QCOMPARE(candidateSpy.at(0).at(0).toString(), next);
        QTest::qWait(50);
        QCOMPARE(candidateSpy.count(), 1);
    }

    void overflowTriggersRescan()
    {
        m_watcher->setAutoCheckReadiness(false);
        QVERIFY(m_watcher->start(m_dir->path()));
        QSignalSpy candidateSpy(m_watcher, &FolderWatcher::candidateDetected);

        QTest::qWait(20);
        const QString lost = writeFile("lost.jpg");
        m_backend->emitOverflow();

        QTRY_COMPARE(candidateSpy.count(), 1);
        QCOMPARE(candidateSpy.at(0).at(0).toString(), lost);
    }

    void nativeBackendReportsNewFiles()
    {
        m_watcher->setBackendFactory(&WatchBackend::createDefault);
        QVERIFY(m_watcher->start(m_dir->path()));
        QSignalSpy readySpy(m_watcher, &FolderWatcher::fileReady);

        const QString path = writeFile("live.jpg", QByteArray(4096, 'q'));
        QTRY_COMPARE_WITH_TIMEOUT(readySpy.count(), 1, 10000);
        QCOMPARE(readySpy.at(0).at(0).toString(), path);
    }
};

QTEST_MAIN(TestFolderWatcher)
#include "tst_folderwatcher.moc"
