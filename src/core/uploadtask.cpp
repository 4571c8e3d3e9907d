module;
#include <QDebug>
#include <QFileInfo>
#include <QPointer>
#include <QTimer>

module skylift.core.uploadtask;

import skylift.utils.upload_errors;
import skylift.utils.upload_utils;
import skylift.services.asset_models;
import skylift.services.asset_transport;
import skylift.core.concurrencycoordinator;
import skylift.core.multiparttransferengine;

namespace utils = skylift::utils;

UploadTask::UploadTask(const QString& id,
                       const QString& filePath,
                       qint64 size,
                       Strategy strategy,
                       AssetTransport* transport,
                       ConcurrencyCoordinator* coordinator,
                       QObject* parent)
    : QObject(parent)
    , m_id(id)
    , m_filePath(filePath)
    , m_size(size)
    , m_strategy(strategy)
    , m_transport(transport)
    , m_coordinator(coordinator)
{
}

QString UploadTask::fileName() const
{
    return QFileInfo(m_filePath).fileName();
}

QString UploadTask::strategyString() const
{
    return m_strategy == Strategy::Multipart ? QStringLiteral("multipart") : QStringLiteral("single");
}

QString UploadTask::stateString() const
{
    switch (m_state) {
    case State::Queued: return "Queued";
    case State::Uploading: return "Active";
    case State::Completed: return "Done";
    case State::Failed: return m_error == UploadError::Cancelled ? "Canceled" : "Error";
    }
    return "Unknown";
}

void UploadTask::start()
{
    if (m_state != State::Queued) return;
    setState(State::Uploading);
    QTimer::singleShot(0, this, &UploadTask::run);
}

void UploadTask::run()
{
    if (m_state != State::Uploading) return;

    if (m_galleryId.isEmpty()) {
        fail(UploadError::NoGallerySelected, utils::errorDescription(UploadError::NoGallerySelected));
        return;
    }
    QFileInfo info(m_filePath);
    if (!info.exists() || !info.isFile()) {
        fail(UploadError::FileNotFound, QStringLiteral("%1: %2").arg(utils::errorDescription(UploadError::FileNotFound), m_filePath));
        return;
    }
    if (!m_transport) {
        fail(UploadError::AssetRequestFailed, QStringLiteral("No transport configured"));
        return;
    }

    CreateAssetRequest request;
    request.gallery = m_galleryId;
    request.section = m_sectionId;
    request.assetName = info.fileName();
    request.contentLength = m_size;
    request.multipart = isMultipart();

    ApiReply* reply = m_transport->createAsset(request);
    m_reply = reply;
    connect(reply, &ApiReply::finished, this, [this, reply]() { onAssetCreated(reply); });
}

void UploadTask::onAssetCreated(ApiReply* reply)
{
    reply->deleteLater();
    m_reply = nullptr;
    if (m_state != State::Uploading) return;

    if (!reply->isSuccess()) {
        fail(reply->errorFor(UploadError::AssetRequestFailed),
             QStringLiteral("%1: %2").arg(utils::errorDescription(UploadError::AssetRequestFailed), reply->errorString()));
        return;
    }

    UploadTarget target;
    QString parseError;
    if (!UploadTarget::fromJson(reply->body(), &target, &parseError)) {
        fail(UploadError::InvalidResponse, QStringLiteral("%1: %2").arg(utils::errorDescription(UploadError::InvalidResponse), parseError));
        return;
    }

    setProgress(0.10);
    if (target.isMultipart()) {
        // The server decides; a small file may still come back as multipart.
        m_strategy = Strategy::Multipart;
        startMultipart(target);
    } else {
        if (m_strategy == Strategy::Multipart) {
            fail(UploadError::InvalidUploadTarget, QStringLiteral("No part URLs returned for multipart upload"));
            return;
        }
        startSinglePart(target);
    }
}

void UploadTask::startSinglePart(const UploadTarget& target)
{
    const QString scheme = target.uploadUrl.scheme().toLower();
    if (!target.uploadUrl.isValid() || target.uploadUrl.host().isEmpty() || (scheme != "https" && scheme != "http")) {
        fail(UploadError::InvalidUploadTarget, utils::errorDescription(UploadError::InvalidUploadTarget));
        return;
    }

    ApiReply* reply = m_transport->uploadForm(target.uploadUrl, target.formFields, m_filePath);
    m_reply = reply;
    connect(reply, &ApiReply::uploadProgress, this, [this](qint64 sent, qint64 total) {
        if (total <= 0 || m_state != State::Uploading) return;
        setProgress(0.10 + 0.85 * (double)sent / total);
        // The form body carries field overhead; scale it back to file bytes.
        const qint64 fileBytes = qMin(m_size, static_cast<qint64>((double)sent / total * m_size));
        addBytes(fileBytes - m_bytesTransferred);
    });
    connect(reply, &ApiReply::finished, this, [this, reply]() {
        reply->deleteLater();
        m_reply = nullptr;
        if (m_state != State::Uploading) return;
        if (!reply->isSuccess()) {
            const UploadError error = reply->error() == UploadError::FileReadError
                                          ? UploadError::FileReadError
                                          : reply->errorFor(UploadError::SinglePartTransferFailed);
            fail(error, QStringLiteral("%1: %2").arg(utils::errorDescription(error), reply->errorString()));
            return;
        }
        addBytes(m_size - m_bytesTransferred);
        complete();
    });
}

void UploadTask::startMultipart(const UploadTarget& target)
{
    auto* engine = new MultipartTransferEngine(m_coordinator, m_transport, m_filePath, m_size, target, this);
    engine->setRetryBaseDelayMs(m_retryBaseDelayMs);
    m_engine = engine;

    connect(engine, &MultipartTransferEngine::progressChanged, this, &UploadTask::setProgress);
    connect(engine, &MultipartTransferEngine::bytesTransferred, this, &UploadTask::addBytes);
    connect(engine, &MultipartTransferEngine::finished, this, [this, engine](bool success) {
        if (m_state != State::Uploading) return;
        if (success) {
            complete();
        } else {
            fail(engine->error(), engine->errorString());
        }
    });
    engine->start();
}

void UploadTask::cancel()
{
    if (isFinished()) return;
    if (m_reply) {
        QObject::disconnect(m_reply, nullptr, this, nullptr);
        m_reply->abort();
        m_reply->deleteLater();
        m_reply = nullptr;
    }
    if (m_engine) {
        QObject::disconnect(m_engine, nullptr, this, nullptr);
        m_engine->cancel();
    }
    fail(UploadError::Cancelled, utils::errorDescription(UploadError::Cancelled));
}

void UploadTask::complete()
{
    setProgress(1.0);
    m_error = UploadError::None;
    m_errorString.clear();
    setState(State::Completed);
    qDebug() << "Upload finished:" << fileName();
    emit finished(true);
}

void UploadTask::fail(UploadError error, const QString& message)
{
    if (isFinished()) return;
    m_error = error;
    m_errorString = message.isEmpty() ? utils::errorDescription(error) : message;
    if (error != UploadError::Cancelled) {
        qWarning() << "Upload failed:" << fileName() << "-" << m_errorString;
    }
    setState(State::Failed);
    emit finished(false);
}

void UploadTask::setState(State state)
{
    if (m_state == state) return;
    m_state = state;
    emit stateChanged();
}

void UploadTask::setProgress(double value)
{
    if (value <= m_progress) return;
    m_progress = qMin(1.0, value);
    emit progressChanged(m_progress);
}

void UploadTask::addBytes(qint64 bytes)
{
    if (bytes <= 0) return;
    m_bytesTransferred += bytes;
    emit bytesTransferredChanged(bytes);
}
