#include <QtTest>

#ifndef Q_MOC_RUN
import skylift.utils.upload_config;
#endif

namespace utils = skylift::utils;

class TestUploadConfig : public QObject
{
    Q_OBJECT

private slots:
    void chunkSizeResolvesFromPartCount_data()
    {
        QTest::addColumn<qint64>("fileSize");
        QTest::addColumn<int>("partCount");
        QTest::addColumn<qint64>("expected");

        QTest::newRow("80MB in 9 parts") << utils::megabytes(80) << 9 << utils::megabytes(10);
        QTest::newRow("55MB in 6 parts") << utils::megabytes(55) << 6 << utils::megabytes(10);
        QTest::newRow("1.5GB in 16 parts") << utils::megabytes(1500) << 16 << utils::megabytes(100);
        QTest::newRow("3GB in 13 parts") << utils::megabytes(3000) << 13 << utils::megabytes(250);
        QTest::newRow("small file in 1 part") << qint64(4096) << 1 << utils::megabytes(10);
    }

    void chunkSizeResolvesFromPartCount()
    {
        QFETCH(qint64, fileSize);
        QFETCH(int, partCount);
        QFETCH(qint64, expected);

        const qint64 chunk = utils::calculateChunkSize(fileSize, partCount);
        QCOMPARE(chunk, expected);
        QCOMPARE(utils::expectedPartCount(fileSize, chunk), partCount);
    }

    void unmatchedPartCountFallsBackToLargestCandidate()
    {
        QCOMPARE(utils::calculateChunkSize(utils::megabytes(80), 42), utils::megabytes(250));
        QCOMPARE(utils::calculateChunkSize(utils::megabytes(80), 3, { 1024, 2048 }), qint64(2048));
    }

    void everyCandidateIsRecoveredFromItsOwnPartCount()
    {
        const QList<qint64> candidates = utils::chunkSizeCandidates();
        QCOMPARE(candidates.size(), 3);
        const QList<qint64> sizes = { utils::megabytes(30), utils::megabytes(260), utils::megabytes(1024),
                                      utils::megabytes(4000) + 17 };
        for (qint64 size : sizes) {
            for (qint64 candidate : candidates) {
                const int parts = utils::expectedPartCount(size, candidate);
                const qint64 resolved = utils::calculateChunkSize(size, parts);
                // Two candidates can map to the same count; the smaller one wins.
                QVERIFY(resolved <= candidate);
                QCOMPARE(utils::expectedPartCount(size, resolved), parts);
            }
        }
    }

    void exactMultipleHasEmptyTrailingPart()
    {
        QCOMPARE(utils::expectedPartCount(utils::megabytes(60), utils::megabytes(10)), 7);
    }

    void multipartThresholdIsStrict()
    {
        const qint64 threshold = utils::defaultMultipartThreshold();
        QCOMPARE(threshold, utils::megabytes(25));
        QVERIFY(!utils::shouldUseMultipart(utils::megabytes(5), threshold));
        QVERIFY(!utils::shouldUseMultipart(threshold, threshold));
        QVERIFY(utils::shouldUseMultipart(threshold + 1, threshold));
        QVERIFY(utils::shouldUseMultipart(utils::megabytes(80), threshold));
    }

    void retryDelayDoubles()
    {
        QCOMPARE(utils::retryDelayMs(0), 1000);
        QCOMPARE(utils::retryDelayMs(1), 2000);
        QCOMPARE(utils::retryDelayMs(2), 4000);
        QCOMPARE(utils::retryDelayMs(2, 10), 40);
        QCOMPARE(utils::retryDelayMs(-3, 10), 10);
    }

    void defaults()
    {
        QCOMPARE(utils::defaultMaxConcurrentSmallFiles(), 4);
        QCOMPARE(utils::defaultMaxConcurrentChunks(), 5);
        QCOMPARE(utils::defaultMaxChunkRetries(), 3);
        QCOMPARE(utils::defaultCompletionDisplayDelayMs(), 2000);
        QCOMPARE(utils::defaultApiTimeoutMs(), 30000);
    }
};

QTEST_MAIN(TestUploadConfig)
#include "tst_uploadconfig.moc"
