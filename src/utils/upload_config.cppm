/*!
 * @file        upload_config.cppm
 * @brief       Transfer policy defaults and the chunk size rules.
 * @details     Holds the defaults used by the scheduler and the multipart
 *              engine (thresholds, concurrency limits, retry policy) and the
 *              calculation that recovers the chunk size the server used when
 *              it split a file into parts.
 *
 *              The server only returns the number of part URLs. Given the
 *              file size F and the returned count N, the chunk size is the
 *              first candidate C for which floor(F / C) + 1 == N, falling back
 *              to the largest candidate when nothing matches.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module skylift.utils.upload_config;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

SKYLIFT_MODULE_EXPORT namespace skylift::utils {

/**
 * @brief Number of bytes in one megabyte (1024 * 1024).
 */
qint64 megabytes(qint64 count);

/**
 * @brief Ordered chunk size candidates: 10 MB, 100 MB, 250 MB.
 */
QList<qint64> chunkSizeCandidates();

/**
 * @brief Infers the chunk size the server used for a multipart upload.
 *
 * @param fileSize Size of the file in bytes.
 * @param partCount Number of part URLs returned by the server.
 * @param candidates Ordered candidate menu; chunkSizeCandidates() when empty.
 * @return The first candidate satisfying fileSize / C + 1 == partCount,
 *         otherwise the largest candidate.
 */
qint64 calculateChunkSize(qint64 fileSize, int partCount, const QList<qint64>& candidates = {});

/**
 * @brief Number of parts a file splits into for a given chunk size.
 *
 * Mirrors the server formula: floor(fileSize / chunkSize) + 1.
 */
int expectedPartCount(qint64 fileSize, qint64 chunkSize);

/**
 * @brief Default size above which a file is uploaded in parts (25 MB).
 */
qint64 defaultMultipartThreshold();

/**
 * @brief Strategy rule: multipart when the size is strictly above the threshold.
 */
bool shouldUseMultipart(qint64 fileSize, qint64 threshold);

int defaultMaxConcurrentSmallFiles();   //!< 4 small files in parallel
int defaultMaxConcurrentChunks();       //!< 5 part uploads in parallel
int defaultMaxChunkRetries();           //!< 3 retries, 4 attempts in total
int defaultRetryBaseDelayMs();          //!< 1000 ms, doubled per attempt
int defaultCompletionDisplayDelayMs();  //!< 2000 ms before a finished queue resets
int defaultApiTimeoutMs();              //!< 30 s per API request

/**
 * @brief Backoff delay before retrying a failed chunk.
 *
 * @param attempt Zero based attempt that just failed.
 * @param baseDelayMs Delay for the first retry.
 * @return baseDelayMs * 2^attempt, i.e. 1 s, 2 s, 4 s with the default base.
 */
int retryDelayMs(int attempt, int baseDelayMs = 1000);

} // namespace skylift::utils
