module;
#include <QByteArray>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QtGlobal>

module skylift.core.chunkedfilereader;

import skylift.utils.upload_errors;

static void setError(UploadError* out, UploadError value)
{
    if (out) *out = value;
}

ChunkedFileReader::~ChunkedFileReader()
{
    close();
}

bool ChunkedFileReader::open(const QString& path, UploadError* error)
{
    close();
    setError(error, UploadError::None);

    QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        setError(error, UploadError::FileNotFound);
        return false;
    }

    QFile probe(path);
    if (!probe.open(QIODevice::ReadOnly)) {
        qWarning() << "ChunkedFileReader: cannot open" << path << probe.errorString();
        setError(error, UploadError::FileReadError);
        return false;
    }

    m_path = path;
    m_size = probe.size();
    m_open.store(true);
    return true;
}

QByteArray ChunkedFileReader::readChunk(int index, qint64 chunkSize, UploadError* error) const
{
    setError(error, UploadError::None);
    if (!m_open.load()) {
        setError(error, UploadError::FileReadError);
        return {};
    }
    if (index < 0 || chunkSize <= 0) {
        setError(error, UploadError::InvalidChunkIndex);
        return {};
    }

    const qint64 offset = static_cast<qint64>(index) * chunkSize;
    const qint64 bytesToRead = qMin(chunkSize, m_size - offset);
    if (bytesToRead <= 0) {
        setError(error, UploadError::InvalidChunkIndex);
        return {};
    }

    QFile file(m_path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "ChunkedFileReader: reopen failed" << m_path << file.errorString();
        setError(error, UploadError::ChunkReadFailed);
        return {};
    }
    if (!file.seek(offset)) {
        qWarning() << "ChunkedFileReader: seek to" << offset << "failed" << file.errorString();
        setError(error, UploadError::ChunkReadFailed);
        return {};
    }

    QByteArray data = file.read(bytesToRead);
    if (data.size() != bytesToRead) {
        qWarning() << "ChunkedFileReader: short read at" << offset
                   << "expected" << bytesToRead << "got" << data.size();
        setError(error, UploadError::ChunkReadFailed);
        return {};
    }
    return data;
}

int ChunkedFileReader::chunkCount(qint64 chunkSize) const
{
    if (chunkSize <= 0 || m_size <= 0) return 0;
    return static_cast<int>((m_size + chunkSize - 1) / chunkSize);
}

void ChunkedFileReader::close()
{
    m_open.store(false);
}
