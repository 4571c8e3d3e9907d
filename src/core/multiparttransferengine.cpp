module;
#include <QDebug>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QPointer>
#include <QSharedPointer>
#include <QTimer>
#include <QtConcurrent>

module skylift.core.multiparttransferengine;

import skylift.utils.upload_config;
import skylift.utils.upload_errors;
import skylift.utils.upload_utils;
import skylift.services.asset_models;
import skylift.services.asset_transport;
import skylift.core.concurrencycoordinator;
import skylift.core.chunkedfilereader;

namespace utils = skylift::utils;

MultipartTransferEngine::MultipartTransferEngine(ConcurrencyCoordinator* coordinator,
                                                 AssetTransport* transport,
                                                 const QString& filePath,
                                                 qint64 fileSize,
                                                 const UploadTarget& target,
                                                 QObject* parent)
    : QObject(parent)
    , m_coordinator(coordinator)
    , m_transport(transport)
    , m_filePath(filePath)
    , m_fileSize(fileSize)
    , m_target(target)
    , m_candidates(utils::chunkSizeCandidates())
    , m_retryBaseDelayMs(utils::defaultRetryBaseDelayMs())
    , m_maxRetries(utils::defaultMaxChunkRetries())
    , m_reader(QSharedPointer<ChunkedFileReader>::create())
{
}

MultipartTransferEngine::~MultipartTransferEngine()
{
    if (m_state == State::Idle || isFinished()) return;
    // Destroyed mid-session: return everything without emitting signals.
    teardownChunks();
    if (m_finalizeReply) {
        QObject::disconnect(m_finalizeReply, nullptr, this, nullptr);
        m_finalizeReply->abort();
        m_finalizeReply->deleteLater();
    }
    if (m_partsStarted) sendAbort();
    releaseLane();
    m_reader->close();
}

void MultipartTransferEngine::setChunkSizeCandidates(const QList<qint64>& candidates)
{
    if (!candidates.isEmpty()) m_candidates = candidates;
}

void MultipartTransferEngine::setRetryBaseDelayMs(int ms)
{
    m_retryBaseDelayMs = qMax(0, ms);
}

void MultipartTransferEngine::setMaxRetries(int retries)
{
    m_maxRetries = qMax(0, retries);
}

QString MultipartTransferEngine::stateString() const
{
    switch (m_state) {
    case State::Idle: return "Queued";
    case State::Waiting: return "Waiting";
    case State::Transferring: return "Active";
    case State::Finalizing: return "Finalizing";
    case State::Completed: return "Done";
    case State::Failed: return "Error";
    case State::Canceled: return "Canceled";
    }
    return "Unknown";
}

bool MultipartTransferEngine::isFinished() const
{
    return m_state == State::Completed || m_state == State::Failed || m_state == State::Canceled;
}

QList<ChunkDescriptor> MultipartTransferEngine::chunks() const
{
    QList<ChunkDescriptor> out;
    out.reserve(m_chunks.size());
    for (const ChunkState& st : m_chunks) out.append(st.descriptor);
    return out;
}

QList<CompletedPart> MultipartTransferEngine::completedParts() const
{
    return utils::sortedParts(m_parts);
}

void MultipartTransferEngine::start()
{
    if (m_state != State::Idle) return;
    if (!m_coordinator || !m_transport) {
        failSession(UploadError::InvalidUploadTarget, QStringLiteral("Transfer engine is not configured"));
        return;
    }
    if (!validateTarget()) return;

    setState(State::Waiting);
    m_exclusiveTicket = m_coordinator->acquireExclusive(this, [this]() { onExclusiveGranted(); });
}

bool MultipartTransferEngine::validateTarget()
{
    if (m_target.partUrls.isEmpty()) {
        failSession(UploadError::InvalidUploadTarget, QStringLiteral("No part URLs returned"));
        return false;
    }
    if (m_target.uploadId.isEmpty()) {
        failSession(UploadError::MissingUploadId, utils::errorDescription(UploadError::MissingUploadId));
        return false;
    }
    if (m_target.originalKey.isEmpty()) {
        failSession(UploadError::MissingOriginalKey, utils::errorDescription(UploadError::MissingOriginalKey));
        return false;
    }
    for (int i = 0; i < m_target.partUrls.size(); ++i) {
        const QUrl& url = m_target.partUrls.at(i);
        const QString scheme = url.scheme().toLower();
        if (!url.isValid() || url.host().isEmpty() || (scheme != "https" && scheme != "http")) {
            failSession(UploadError::InvalidUploadTarget, QStringLiteral("Invalid URL for part %1").arg(i + 1));
            return false;
        }
    }
    return true;
}

void MultipartTransferEngine::onExclusiveGranted()
{
    m_exclusiveTicket = 0;
    m_holdingExclusive = true;
    if (m_state != State::Waiting) {
        releaseLane();
        return;
    }

    UploadError openError = UploadError::None;
    if (!m_reader->open(m_filePath, &openError)) {
        failSession(openError, QStringLiteral("%1: %2").arg(utils::errorDescription(openError), m_filePath));
        return;
    }
    if (m_reader->fileSize() != m_fileSize) {
        qWarning() << "Multipart: file size changed since the upload was announced"
                   << m_filePath << m_fileSize << "->" << m_reader->fileSize();
        failSession(UploadError::FileReadError, QStringLiteral("File changed during upload: %1").arg(m_filePath));
        return;
    }
    if (!buildChunks()) return;

    qDebug() << "Multipart: starting" << QFileInfo(m_filePath).fileName()
             << "parts:" << m_chunks.size() << "chunk size:" << utils::formatBytes(m_chunkSize);

    setState(State::Transferring);
    setProgress(0.10);
    for (int i = 0; i < m_chunks.size(); ++i) {
        requestSlot(i);
    }
}

bool MultipartTransferEngine::buildChunks()
{
    const int partCount = m_target.partUrls.size();
    m_chunkSize = utils::calculateChunkSize(m_fileSize, partCount, m_candidates);

    // The server splits into floor(F / C) + 1 parts, so every part but the
    // last must start inside the file.
    if (static_cast<qint64>(partCount - 1) * m_chunkSize > m_fileSize) {
        failSession(UploadError::InvalidUploadTarget,
                    QStringLiteral("Server returned %1 parts for a %2 file")
                        .arg(partCount).arg(utils::formatBytes(m_fileSize)));
        return false;
    }

    m_chunks.clear();
    m_chunks.reserve(partCount);
    for (int i = 0; i < partCount; ++i) {
        ChunkState st;
        st.descriptor.partNumber = i + 1;
        st.descriptor.offset = static_cast<qint64>(i) * m_chunkSize;
        st.descriptor.length = qMax<qint64>(0, qMin(m_chunkSize, m_fileSize - st.descriptor.offset));
        st.descriptor.targetUrl = m_target.partUrls.at(i);
        m_chunks.append(st);
    }
    return true;
}

void MultipartTransferEngine::requestSlot(int index)
{
    ChunkState& st = m_chunks[index];
    st.slotTicket = m_coordinator->acquireSlot(this, [this, index]() { onSlotGranted(index); });
}

void MultipartTransferEngine::onSlotGranted(int index)
{
    if (index < 0 || index >= m_chunks.size()) return;
    ChunkState& st = m_chunks[index];
    st.slotTicket = 0;
    st.holdingSlot = true;
    if (m_state != State::Transferring) {
        releaseChunkSlot(index);
        return;
    }
    m_partsStarted = true;
    readChunk(index);
}

void MultipartTransferEngine::readChunk(int index)
{
    ChunkState& st = m_chunks[index];
    if (st.descriptor.length == 0) {
        // Trailing part of a file whose size is an exact multiple of the chunk size.
        st.data.clear();
        sendChunk(index);
        return;
    }

    auto* watcher = new QFutureWatcher<ChunkReadResult>(this);
    st.readWatcher = watcher;
    connect(watcher, &QFutureWatcher<ChunkReadResult>::finished, this, [this, index]() { onChunkRead(index); });

    QSharedPointer<ChunkedFileReader> reader = m_reader;
    const qint64 chunkSize = m_chunkSize;
    const int chunkIndex = st.descriptor.partNumber - 1;
    watcher->setFuture(QtConcurrent::run([reader, chunkIndex, chunkSize]() {
        ChunkReadResult result;
        result.data = reader->readChunk(chunkIndex, chunkSize, &result.error);
        return result;
    }));
}

void MultipartTransferEngine::onChunkRead(int index)
{
    ChunkState& st = m_chunks[index];
    QFutureWatcher<ChunkReadResult>* watcher = st.readWatcher;
    st.readWatcher = nullptr;
    if (!watcher) return;
    const ChunkReadResult result = watcher->result();
    watcher->deleteLater();

    if (m_state != State::Transferring) return;
    if (result.error != UploadError::None) {
        failSession(result.error, QStringLiteral("Part %1: %2")
                                      .arg(st.descriptor.partNumber)
                                      .arg(utils::errorDescription(result.error)));
        return;
    }
    st.data = result.data;
    sendChunk(index);
}

void MultipartTransferEngine::sendChunk(int index)
{
    ChunkState& st = m_chunks[index];
    if (st.retryTimer) {
        st.retryTimer->deleteLater();
        st.retryTimer = nullptr;
    }
    if (m_state != State::Transferring || !m_transport) return;

    ApiReply* reply = m_transport->uploadPart(st.descriptor.targetUrl, st.data);
    st.reply = reply;
    connect(reply, &ApiReply::finished, this, [this, index, reply]() { onChunkReplyFinished(index, reply); });
}

void MultipartTransferEngine::onChunkReplyFinished(int index, ApiReply* reply)
{
    reply->deleteLater();
    ChunkState& st = m_chunks[index];
    st.reply = nullptr;
    if (m_state != State::Transferring) return;

    if (!reply->isSuccess()) {
        scheduleRetry(index, reply->errorFor(UploadError::ChunkTransferFailed), reply->errorString());
        return;
    }

    const QString etag = utils::unquoteETag(QString::fromUtf8(reply->header("ETag")));
    if (etag.isEmpty()) {
        scheduleRetry(index, UploadError::MissingETag, utils::errorDescription(UploadError::MissingETag));
        return;
    }

    st.done = true;
    st.data.clear();
    releaseChunkSlot(index);

    m_parts.append({ st.descriptor.partNumber, etag });
    m_bytesUploaded += st.descriptor.length;
    emit bytesTransferred(st.descriptor.length);
    emit partCompleted(st.descriptor.partNumber, st.descriptor.length);
    setProgress(0.10 + 0.85 * (double)m_parts.size() / m_chunks.size());

    if (m_parts.size() == m_chunks.size()) {
        finalize();
    }
}

void MultipartTransferEngine::scheduleRetry(int index, UploadError error, const QString& reason)
{
    ChunkState& st = m_chunks[index];
    if (st.attempt >= m_maxRetries) {
        const UploadError finalError = (error == UploadError::Timeout || error == UploadError::MissingETag)
                                           ? error
                                           : UploadError::ChunkTransferFailed;
        failSession(finalError, QStringLiteral("Part %1 failed after %2 attempts: %3")
                                    .arg(st.descriptor.partNumber)
                                    .arg(st.attempt + 1)
                                    .arg(reason));
        return;
    }

    const int delay = utils::retryDelayMs(st.attempt, m_retryBaseDelayMs);
    st.attempt++;
    qWarning() << "Multipart: part" << st.descriptor.partNumber << "failed:" << reason
               << "- retry" << st.attempt << "of" << m_maxRetries << "in" << delay << "ms";
    emit chunkRetryScheduled(st.descriptor.partNumber, st.attempt, delay);

    // The slot stays with the part while it backs off.
    st.retryTimer = new QTimer(this);
    st.retryTimer->setSingleShot(true);
    connect(st.retryTimer, &QTimer::timeout, this, [this, index]() { sendChunk(index); });
    st.retryTimer->start(delay);
}

void MultipartTransferEngine::finalize()
{
    setState(State::Finalizing);
    setProgress(0.95);

    CompleteMultipartRequest request;
    request.key = m_target.originalKey;
    request.uploadId = m_target.uploadId;
    request.parts = completedParts();

    ApiReply* reply = m_transport->completeMultipart(request);
    m_finalizeReply = reply;
    connect(reply, &ApiReply::finished, this, [this, reply]() { onFinalizeFinished(reply); });
}

void MultipartTransferEngine::onFinalizeFinished(ApiReply* reply)
{
    reply->deleteLater();
    m_finalizeReply = nullptr;
    if (m_state != State::Finalizing) return;

    if (!reply->isSuccess()) {
        failSession(reply->errorFor(UploadError::MultipartCompletionFailed),
                    QStringLiteral("%1: %2").arg(utils::errorDescription(UploadError::MultipartCompletionFailed),
                                                 reply->errorString()));
        return;
    }

    releaseLane();
    m_reader->close();
    setProgress(1.0);
    setState(State::Completed);
    emit finished(true);
}

void MultipartTransferEngine::cancel()
{
    if (isFinished()) return;
    m_error = UploadError::Cancelled;
    m_errorString = utils::errorDescription(UploadError::Cancelled);

    teardownChunks();
    if (m_finalizeReply) {
        QObject::disconnect(m_finalizeReply, nullptr, this, nullptr);
        m_finalizeReply->abort();
        m_finalizeReply->deleteLater();
        m_finalizeReply = nullptr;
    }
    if (m_partsStarted) sendAbort();
    releaseLane();
    m_reader->close();

    setState(State::Canceled);
    emit finished(false);
}

void MultipartTransferEngine::releaseChunkSlot(int index)
{
    ChunkState& st = m_chunks[index];
    if (st.holdingSlot) {
        st.holdingSlot = false;
        if (m_coordinator) m_coordinator->releaseSlot();
    }
}

void MultipartTransferEngine::teardownChunks()
{
    for (int i = 0; i < m_chunks.size(); ++i) {
        ChunkState& st = m_chunks[i];
        if (st.reply) {
            QObject::disconnect(st.reply, nullptr, this, nullptr);
            st.reply->abort();
            st.reply->deleteLater();
            st.reply = nullptr;
        }
        if (st.retryTimer) {
            st.retryTimer->stop();
            st.retryTimer->deleteLater();
            st.retryTimer = nullptr;
        }
        if (st.readWatcher) {
            // The read keeps running on the pool; the shared reader outlives it.
            QObject::disconnect(st.readWatcher, nullptr, this, nullptr);
            st.readWatcher->deleteLater();
            st.readWatcher = nullptr;
        }
        if (st.slotTicket != 0) {
            if (m_coordinator) m_coordinator->cancelPending(st.slotTicket);
            st.slotTicket = 0;
        }
        releaseChunkSlot(i);
        st.data.clear();
    }
}

void MultipartTransferEngine::releaseLane()
{
    if (m_exclusiveTicket != 0) {
        if (m_coordinator) m_coordinator->cancelPending(m_exclusiveTicket);
        m_exclusiveTicket = 0;
    }
    if (m_holdingExclusive) {
        m_holdingExclusive = false;
        if (m_coordinator) m_coordinator->releaseExclusive();
    }
}

void MultipartTransferEngine::sendAbort()
{
    if (!m_transport || m_target.uploadId.isEmpty() || m_target.originalKey.isEmpty()) return;

    AbortMultipartRequest request;
    request.key = m_target.originalKey;
    request.uploadId = m_target.uploadId;

    ApiReply* reply = m_transport->abortMultipart(request);
    const QString uploadId = m_target.uploadId;
    connect(reply, &ApiReply::finished, reply, [reply, uploadId]() {
        if (!reply->isSuccess()) {
            qWarning() << "Multipart: abort of" << uploadId << "failed:" << reply->errorString();
        } else {
            qDebug() << "Multipart: aborted" << uploadId;
        }
        reply->deleteLater();
    });
}

void MultipartTransferEngine::failSession(UploadError error, const QString& message)
{
    if (isFinished()) return;
    m_error = error;
    m_errorString = message.isEmpty() ? utils::errorDescription(error) : message;
    qWarning() << "Multipart: upload failed" << m_filePath << "-" << m_errorString;

    teardownChunks();
    if (m_partsStarted) sendAbort();
    releaseLane();
    m_reader->close();

    setState(State::Failed);
    emit finished(false);
}

void MultipartTransferEngine::setState(State state)
{
    if (m_state == state) return;
    m_state = state;
    emit stateChanged();
}

void MultipartTransferEngine::setProgress(double value)
{
    if (value <= m_progress) return;
    m_progress = qMin(1.0, value);
    emit progressChanged(m_progress);
}
