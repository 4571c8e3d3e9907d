/*!
 * @file        chunkedfilereader.cppm
 * @brief       Random access reader for fixed-size file chunks.
 * @details     Reads byte ranges of a source file on demand. Every read opens
 *              its own file handle and seeks independently, so chunks can be
 *              read out of order and from several worker threads at once.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <atomic>
#include <QByteArray>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module skylift.core.chunkedfilereader;
import skylift.utils.upload_errors;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief Reads chunk ranges of one file.
 *
 * The reader captures the file size at open() time. readChunk() is safe to
 * call concurrently once open() has returned.
 */
SKYLIFT_MODULE_EXPORT class ChunkedFileReader {
public:
    ChunkedFileReader() = default;
    ~ChunkedFileReader();

    ChunkedFileReader(const ChunkedFileReader&) = delete;
    ChunkedFileReader& operator=(const ChunkedFileReader&) = delete;

    /**
     * @brief Open a file for chunked reading.
     *
     * @param path Local file path.
     * @param error Receives FileNotFound or FileReadError on failure.
     * @return true on success.
     */
    bool open(const QString& path, UploadError* error = nullptr);

    /**
     * @brief Read the chunk at a zero based index.
     *
     * offset = index * chunkSize and the length is
     * min(chunkSize, fileSize - offset).
     *
     * @param index Zero based chunk index.
     * @param chunkSize Chunk size in bytes.
     * @param error Receives InvalidChunkIndex or ChunkReadFailed on failure.
     * @return Chunk bytes, or an empty array on failure.
     */
    QByteArray readChunk(int index, qint64 chunkSize, UploadError* error = nullptr) const;

    /**
     * @brief Number of chunks covering the file for a chunk size.
     */
    int chunkCount(qint64 chunkSize) const;

    /**
     * @brief Release the reader. Safe to call any number of times.
     */
    void close();

    bool isOpen() const { return m_open.load(); }
    QString filePath() const { return m_path; }
    qint64 fileSize() const { return m_size; }

private:
    QString m_path;                     //!< Source file path
    qint64 m_size = 0;                  //!< Size captured at open()
    std::atomic_bool m_open { false };  //!< Open state, read from worker threads
};
