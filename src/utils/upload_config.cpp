module;
#include <algorithm>
#include <QList>
#include <QtGlobal>

module skylift.utils.upload_config;

namespace skylift::utils {

qint64 megabytes(qint64 count)
{
    return count * 1024 * 1024;
}

QList<qint64> chunkSizeCandidates()
{
    return { megabytes(10), megabytes(100), megabytes(250) };
}

qint64 calculateChunkSize(qint64 fileSize, int partCount, const QList<qint64>& candidates)
{
    const QList<qint64> menu = candidates.isEmpty() ? chunkSizeCandidates() : candidates;
    for (qint64 candidate : menu) {
        if (candidate <= 0) continue;
        if (expectedPartCount(fileSize, candidate) == partCount) {
            return candidate;
        }
    }
    return *std::max_element(menu.cbegin(), menu.cend());
}

int expectedPartCount(qint64 fileSize, qint64 chunkSize)
{
    if (chunkSize <= 0) return 0;
    return static_cast<int>(fileSize / chunkSize) + 1;
}

qint64 defaultMultipartThreshold()
{
    return megabytes(25);
}

bool shouldUseMultipart(qint64 fileSize, qint64 threshold)
{
    return fileSize > threshold;
}

int defaultMaxConcurrentSmallFiles() { return 4; }
int defaultMaxConcurrentChunks() { return 5; }
int defaultMaxChunkRetries() { return 3; }
int defaultRetryBaseDelayMs() { return 1000; }
int defaultCompletionDisplayDelayMs() { return 2000; }
int defaultApiTimeoutMs() { return 30000; }

int retryDelayMs(int attempt, int baseDelayMs)
{
    const int shift = qBound(0, attempt, 16);
    return baseDelayMs * (1 << shift);
}

} // namespace skylift::utils
