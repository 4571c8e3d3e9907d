#include <QtTest>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#ifndef Q_MOC_RUN
import skylift.utils.upload_config;
import skylift.utils.upload_errors;
import skylift.services.asset_models;
import skylift.services.asset_transport;
import skylift.core.concurrencycoordinator;
import skylift.core.multiparttransferengine;
#endif

#include "mocks/mockassettransport.h"

namespace utils = skylift::utils;

class TestMultipartTransferEngine : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    QString makeFile(const QString& name, qint64 size)
    {
        const QString path = m_dir.filePath(name);
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly) || !file.resize(size)) return QString();
        return path;
    }

    static UploadTarget makeTarget(int parts, const QString& host = QStringLiteral("storage.test"))
    {
        UploadTarget target;
        target.assetId = "asset-1";
        target.originalKey = "originals/big.tif";
        target.uploadId = "upload-1";
        for (int i = 1; i <= parts; ++i) {
            target.partUrls.append(QUrl(QStringLiteral("https://%1/1/part?n=%2").arg(host).arg(i)));
        }
        return target;
    }

private slots:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
    }

    void uploadsEightyMegabytesInNineParts()
    {
        const qint64 size = utils::megabytes(80);
        const QString path = makeFile("eighty.tif", size);
        QVERIFY(!path.isEmpty());

        MockAssetTransport transport;
        transport.partDelayMs = 20;
        ConcurrencyCoordinator coordinator(utils::defaultMaxConcurrentChunks());
        MultipartTransferEngine engine(&coordinator, &transport, path, size, makeTarget(9));
        QSignalSpy finishedSpy(&engine, &MultipartTransferEngine::finished);

        engine.start();
        QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 30000);
        QCOMPARE(finishedSpy.at(0).at(0).toBool(), true);
        QCOMPARE(engine.state(), MultipartTransferEngine::State::Completed);
        QCOMPARE(engine.chunkSize(), utils::megabytes(10));
        QCOMPARE(engine.totalParts(), 9);

        QCOMPARE(transport.partRequests.size(), 9);
        QVERIFY(transport.maxPartsInFlight <= 5);
        QVERIFY(transport.maxPartsInFlight > 1);
        QCOMPARE(transport.partSizes.value(1), utils::megabytes(10));
        QCOMPARE(transport.partSizes.value(8), utils::megabytes(10));
        QCOMPARE(transport.partSizes.value(9), qint64(0));

        QCOMPARE(transport.completeRequests.size(), 1);
        const CompleteMultipartRequest& complete = transport.completeRequests.first();
        QCOMPARE(complete.key, QString("originals/big.tif"));
        QCOMPARE(complete.uploadId, QString("upload-1"));
        QCOMPARE(complete.parts.size(), 9);
        for (int i = 0; i < complete.parts.size(); ++i) {
            QCOMPARE(complete.parts.at(i).partNumber, i + 1);
            QCOMPARE(complete.parts.at(i).eTag, QStringLiteral("etag-%1").arg(i + 1));
        }

        QCOMPARE(engine.progress(), 1.0);
        QCOMPARE(engine.bytesUploaded(), size);
        QCOMPARE(coordinator.activeCount(), 0);
        QVERIFY(!coordinator.isExclusiveHeld());
        QVERIFY(transport.abortRequests.isEmpty());
    }

    void progressNeverDecreases()
    {
        const QString path = makeFile("progress.bin", 5000);
        MockAssetTransport transport;
        ConcurrencyCoordinator coordinator(2);
        MultipartTransferEngine engine(&coordinator, &transport, path, 5000, makeTarget(5));
        engine.setChunkSizeCandidates({ 1024, 4096 });

        QList<double> values;
        connect(&engine, &MultipartTransferEngine::progressChanged, this, [&values](double p) { values.append(p); });
        QSignalSpy finishedSpy(&engine, &MultipartTransferEngine::finished);
        engine.start();
        QTRY_COMPARE(finishedSpy.count(), 1);

        QVERIFY(values.size() >= 3);
        QCOMPARE(values.first(), 0.10);
        QCOMPARE(values.last(), 1.0);
        for (int i = 1; i < values.size(); ++i) QVERIFY(values.at(i) > values.at(i - 1));
    }

    void transientFailureRetriesWithDoublingDelay()
    {
        const QString path = makeFile("flaky.bin", 5000);
        MockAssetTransport transport;
        transport.partFailures.insert(3, 2);
        ConcurrencyCoordinator coordinator;
        MultipartTransferEngine engine(&coordinator, &transport, path, 5000, makeTarget(5));
        engine.setChunkSizeCandidates({ 1024 });
        engine.setRetryBaseDelayMs(10);

        QSignalSpy retrySpy(&engine, &MultipartTransferEngine::chunkRetryScheduled);
        QSignalSpy finishedSpy(&engine, &MultipartTransferEngine::finished);
        engine.start();
        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).toBool(), true);

        QCOMPARE(retrySpy.count(), 2);
        QCOMPARE(retrySpy.at(0).at(0).toInt(), 3);
        QCOMPARE(retrySpy.at(0).at(1).toInt(), 1);
        QCOMPARE(retrySpy.at(0).at(2).toInt(), 10);
        QCOMPARE(retrySpy.at(1).at(1).toInt(), 2);
        QCOMPARE(retrySpy.at(1).at(2).toInt(), 20);
        QCOMPARE(transport.partRequests.count(3), 3);
        QCOMPARE(transport.completeRequests.size(), 1);
    }

    void missingETagIsRetried()
    {
        const QString path = makeFile("noetag.bin", 3000);
        MockAssetTransport transport;
        transport.missingETags.insert(2, 1);
        ConcurrencyCoordinator coordinator;
        MultipartTransferEngine engine(&coordinator, &transport, path, 3000, makeTarget(3));
        engine.setChunkSizeCandidates({ 1024 });
        engine.setRetryBaseDelayMs(5);

        QSignalSpy retrySpy(&engine, &MultipartTransferEngine::chunkRetryScheduled);
        QSignalSpy finishedSpy(&engine, &MultipartTransferEngine::finished);
        engine.start();
        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).toBool(), true);
        QCOMPARE(retrySpy.count(), 1);
        QCOMPARE(retrySpy.at(0).at(0).toInt(), 2);
    }

    void exhaustedRetriesAbortTheSession()
    {
        const QString path = makeFile("broken.bin", 5000);
        MockAssetTransport transport;
        transport.partFailures.insert(2, 100);
        ConcurrencyCoordinator coordinator(3);
        MultipartTransferEngine engine(&coordinator, &transport, path, 5000, makeTarget(5));
        engine.setChunkSizeCandidates({ 1024 });
        engine.setRetryBaseDelayMs(10);

        QSignalSpy retrySpy(&engine, &MultipartTransferEngine::chunkRetryScheduled);
        QSignalSpy finishedSpy(&engine, &MultipartTransferEngine::finished);
        engine.start();
        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).toBool(), false);
        QCOMPARE(engine.state(), MultipartTransferEngine::State::Failed);
        QCOMPARE(engine.error(), UploadError::ChunkTransferFailed);

        QCOMPARE(retrySpy.count(), 3);
        QCOMPARE(retrySpy.at(2).at(2).toInt(), 40);
        QCOMPARE(transport.partRequests.count(2), 4);
        QVERIFY(transport.completeRequests.isEmpty());
        QCOMPARE(transport.abortRequests.size(), 1);
        QCOMPARE(transport.abortRequests.first().uploadId, QString("upload-1"));

        QTRY_COMPARE(coordinator.activeCount(), 0);
        QVERIFY(!coordinator.isExclusiveHeld());
        QCOMPARE(coordinator.waitingCount(), 0);
    }

    void completionFailureReleasesTheLane()
    {
        const QString path = makeFile("nocomplete.bin", 2000);
        MockAssetTransport transport;
        transport.failComplete = true;
        ConcurrencyCoordinator coordinator;
        MultipartTransferEngine engine(&coordinator, &transport, path, 2000, makeTarget(2));
        engine.setChunkSizeCandidates({ 1024 });

        QSignalSpy finishedSpy(&engine, &MultipartTransferEngine::finished);
        engine.start();
        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(engine.error(), UploadError::MultipartCompletionFailed);
        QCOMPARE(transport.abortRequests.size(), 1);
        QVERIFY(!coordinator.isExclusiveHeld());
        QCOMPARE(coordinator.activeCount(), 0);
    }

    void invalidTargetsFailBeforeTransfer_data()
    {
        QTest::addColumn<int>("defect");
        QTest::addColumn<int>("expected");

        QTest::newRow("no part urls") << 0 << int(UploadError::InvalidUploadTarget);
        QTest::newRow("no upload id") << 1 << int(UploadError::MissingUploadId);
        QTest::newRow("no key") << 2 << int(UploadError::MissingOriginalKey);
        QTest::newRow("bad scheme") << 3 << int(UploadError::InvalidUploadTarget);
    }

    void invalidTargetsFailBeforeTransfer()
    {
        QFETCH(int, defect);
        QFETCH(int, expected);

        const QString path = makeFile("invalid.bin", 2000);
        UploadTarget target = makeTarget(2);
        switch (defect) {
        case 0: target.partUrls.clear(); break;
        case 1: target.uploadId.clear(); break;
        case 2: target.originalKey.clear(); break;
        case 3: target.partUrls[1] = QUrl("ftp://storage.test/1/part?n=2"); break;
        }

        MockAssetTransport transport;
        ConcurrencyCoordinator coordinator;
        MultipartTransferEngine engine(&coordinator, &transport, path, 2000, target);
        QSignalSpy finishedSpy(&engine, &MultipartTransferEngine::finished);
        engine.start();

        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(int(engine.error()), expected);
        QVERIFY(transport.partRequests.isEmpty());
        QVERIFY(transport.abortRequests.isEmpty());
        QVERIFY(!coordinator.isExclusiveHeld());
    }

    void partCountMustFitTheFile()
    {
        const QString path = makeFile("toomany.bin", 5000);
        MockAssetTransport transport;
        ConcurrencyCoordinator coordinator;
        MultipartTransferEngine engine(&coordinator, &transport, path, 5000, makeTarget(9));
        engine.setChunkSizeCandidates({ 1024 });

        QSignalSpy finishedSpy(&engine, &MultipartTransferEngine::finished);
        engine.start();
        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(engine.error(), UploadError::InvalidUploadTarget);
        QVERIFY(transport.partRequests.isEmpty());
        QVERIFY(!coordinator.isExclusiveHeld());
    }

    void changedFileSizeIsAReadError()
    {
        const QString path = makeFile("changed.bin", 3000);
        MockAssetTransport transport;
        ConcurrencyCoordinator coordinator;
        MultipartTransferEngine engine(&coordinator, &transport, path, 2500, makeTarget(3));
        engine.setChunkSizeCandidates({ 1024 });

        QSignalSpy finishedSpy(&engine, &MultipartTransferEngine::finished);
        engine.start();
        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(engine.error(), UploadError::FileReadError);
    }

    void sessionsShareTheExclusiveLane()
    {
        const QString first = makeFile("first.bin", 4000);
        const QString second = makeFile("second.bin", 4000);
        MockAssetTransport transport;
        transport.partDelayMs = 30;
        ConcurrencyCoordinator coordinator;
        MultipartTransferEngine a(&coordinator, &transport, first, 4000, makeTarget(4));
        MultipartTransferEngine b(&coordinator, &transport, second, 4000, makeTarget(4, "other.test"));
        a.setChunkSizeCandidates({ 1024 });
        b.setChunkSizeCandidates({ 1024 });

        bool overlapped = false;
        connect(&b, &MultipartTransferEngine::stateChanged, this, [&]() {
            if (b.state() == MultipartTransferEngine::State::Transferring && !a.isFinished()) overlapped = true;
        });
        QSignalSpy aSpy(&a, &MultipartTransferEngine::finished);
        QSignalSpy bSpy(&b, &MultipartTransferEngine::finished);

        a.start();
        b.start();
        QCOMPARE(b.state(), MultipartTransferEngine::State::Waiting);
        QTRY_COMPARE(aSpy.count(), 1);
        QTRY_COMPARE(bSpy.count(), 1);
        QVERIFY(!overlapped);
        QCOMPARE(transport.completeRequests.size(), 2);
    }

    void cancelReleasesSlotsAndLane()
    {
        const QString path = makeFile("cancel.bin", 8000);
        MockAssetTransport transport;
        transport.partDelayMs = 2000;
        ConcurrencyCoordinator coordinator(2);
        auto* engine = new MultipartTransferEngine(&coordinator, &transport, path, 8000, makeTarget(8));
        engine->setChunkSizeCandidates({ 1024 });

        QSignalSpy finishedSpy(engine, &MultipartTransferEngine::finished);
        engine->start();
        QTRY_COMPARE(transport.partsInFlight, 2);
        QCOMPARE(coordinator.waitingCount(), 6);

        engine->cancel();
        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).toBool(), false);
        QCOMPARE(engine->state(), MultipartTransferEngine::State::Canceled);
        QCOMPARE(engine->error(), UploadError::Cancelled);
        QCOMPARE(transport.partsInFlight, 0);
        QCOMPARE(transport.abortRequests.size(), 1);
        QCOMPARE(coordinator.waitingCount(), 0);
        QTRY_COMPARE(coordinator.activeCount(), 0);
        QVERIFY(!coordinator.isExclusiveHeld());
        delete engine;

        // The lane is usable again.
        transport.partDelayMs = 5;
        const QString next = makeFile("after.bin", 2000);
        MultipartTransferEngine after(&coordinator, &transport, next, 2000, makeTarget(2));
        after.setChunkSizeCandidates({ 1024 });
        QSignalSpy afterSpy(&after, &MultipartTransferEngine::finished);
        after.start();
        QTRY_COMPARE(afterSpy.count(), 1);
        QCOMPARE(afterSpy.at(0).at(0).toBool(), true);
    }

    void destroyingARunningSessionReleasesTheLane()
    {
        const QString path = makeFile("destroyed.bin", 4000);
        MockAssetTransport transport;
        transport.partDelayMs = 2000;
        ConcurrencyCoordinator coordinator(2);
        {
            MultipartTransferEngine engine(&coordinator, &transport, path, 4000, makeTarget(4));
            engine.setChunkSizeCandidates({ 1024 });
            engine.start();
            QTRY_COMPARE(transport.partsInFlight, 2);
        }
        QCOMPARE(transport.abortRequests.size(), 1);
        QTRY_COMPARE(coordinator.activeCount(), 0);
        QVERIFY(!coordinator.isExclusiveHeld());
    }
};

QTEST_MAIN(TestMultipartTransferEngine)
#include "tst_multiparttransferengine.moc"
