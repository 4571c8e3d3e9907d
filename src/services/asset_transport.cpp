module;
#include <QDebug>
#include <QFile>
#include <QHttpMultiPart>
#include <QHttpPart>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QSettings>
#include <QTimer>
#include <QVariant>

module skylift.services.asset_transport;

import skylift.utils.upload_config;
import skylift.utils.upload_errors;
import skylift.utils.upload_utils;
import skylift.services.asset_models;

namespace utils = skylift::utils;

static QString settingsGroup()
{
    return QStringLiteral("api");
}

// ---------------------------------------------------------------------------
// ApiReply

ApiReply::ApiReply(QObject* parent)
    : QObject(parent)
{
}

QByteArray ApiReply::header(const QByteArray& name) const
{
    return m_headers.value(name.toLower());
}

bool ApiReply::isSuccess() const
{
    return m_finished && m_error == UploadError::None && utils::isSuccessStatus(m_status);
}

UploadError ApiReply::errorFor(UploadError operationError) const
{
    if (isSuccess()) return UploadError::None;
    if (m_error == UploadError::Timeout || m_error == UploadError::Cancelled) return m_error;
    return operationError;
}

void ApiReply::abort()
{
    fail(UploadError::Cancelled, utils::errorDescription(UploadError::Cancelled));
}

void ApiReply::finish(int status, const QByteArray& body, const QHash<QByteArray, QByteArray>& headers)
{
    if (m_finished) return;
    m_finished = true;
    m_status = status;
    m_body = body;
    m_headers.clear();
    for (auto it = headers.cbegin(); it != headers.cend(); ++it) {
        m_headers.insert(it.key().toLower(), it.value());
    }
    if (!utils::isSuccessStatus(status)) {
        m_errorString = QStringLiteral("HTTP %1").arg(status);
    }
    emit finished();
}

void ApiReply::fail(UploadError error, const QString& message)
{
    if (m_finished) return;
    m_finished = true;
    m_error = error;
    m_errorString = message.isEmpty() ? utils::errorDescription(error) : message;
    emit finished();
}

void ApiReply::failLater(UploadError error, const QString& message)
{
    QPointer<ApiReply> self(this);
    QTimer::singleShot(0, this, [self, error, message]() {
        if (self) self->fail(error, message);
    });
}

// ---------------------------------------------------------------------------
// NetworkApiReply

namespace {

/**
 * @brief ApiReply wrapping a QNetworkReply.
 */
class NetworkApiReply : public ApiReply {
public:
    NetworkApiReply(QNetworkReply* reply, UploadError operationError)
        : m_reply(reply)
    {
        reply->setParent(this);
        QPointer<QNetworkReply> replyPtr(reply);

        connect(reply, &QNetworkReply::uploadProgress, this, &ApiReply::uploadProgress);
        connect(reply, &QNetworkReply::finished, this, [this, replyPtr, operationError]() {
            if (!replyPtr) return;
            const QVariant statusAttr = replyPtr->attribute(QNetworkRequest::HttpStatusCodeAttribute);
            const QNetworkReply::NetworkError netError = replyPtr->error();

            if (statusAttr.isValid() && statusAttr.toInt() > 0) {
                QHash<QByteArray, QByteArray> headers;
                for (const auto& pair : replyPtr->rawHeaderPairs()) {
                    headers.insert(pair.first, pair.second);
                }
                finish(statusAttr.toInt(), replyPtr->readAll(), headers);
            } else if (netError == QNetworkReply::TimeoutError
                       || (netError == QNetworkReply::OperationCanceledError && !m_aborted)) {
                qWarning() << "Request timed out:" << replyPtr->url().toString(QUrl::RemoveQuery);
                fail(UploadError::Timeout, replyPtr->errorString());
            } else if (m_aborted) {
                fail(UploadError::Cancelled, utils::errorDescription(UploadError::Cancelled));
            } else {
                qWarning() << "Request error:" << replyPtr->errorString();
                fail(operationError, replyPtr->errorString());
            }
            replyPtr->deleteLater();
        });
    }

    void abort() override
    {
        if (isFinished()) return;
        m_aborted = true;
        if (m_reply) {
            m_reply->abort();
        } else {
            ApiReply::abort();
        }
    }

private:
    QPointer<QNetworkReply> m_reply;
    bool m_aborted = false;
};

} // namespace

// ---------------------------------------------------------------------------
// AssetTransport

AssetTransport::AssetTransport(QObject* parent)
    : QObject(parent)
{
}

// ---------------------------------------------------------------------------
// NetworkAssetTransport

NetworkAssetTransport::NetworkAssetTransport(QObject* parent)
    : AssetTransport(parent)
{
    m_environment = QStringLiteral("production");
    m_baseUrl = baseUrlForEnvironment(m_environment);
    m_timeoutMs = utils::defaultApiTimeoutMs();
    loadSettings();
}

QUrl NetworkAssetTransport::baseUrlForEnvironment(const QString& environment)
{
    const QString env = environment.trimmed().toLower();
    if (env == "development" || env == "dev") {
        return QUrl(QStringLiteral("https://dev.picflow.com/api"));
    }
    return QUrl(QStringLiteral("https://picflow.com/api"));
}

void NetworkAssetTransport::setBaseUrl(const QUrl& url)
{
    if (!url.isValid() || m_baseUrl == url) return;
    m_baseUrl = url;
    emit configurationChanged();
}

void NetworkAssetTransport::setEnvironment(const QString& environment)
{
    m_environment = environment.trimmed().isEmpty() ? QStringLiteral("production") : environment.trimmed();
    setBaseUrl(baseUrlForEnvironment(m_environment));
}

void NetworkAssetTransport::setTimeoutMs(int ms)
{
    if (ms < 1000) ms = 1000;
    if (m_timeoutMs == ms) return;
    m_timeoutMs = ms;
    emit configurationChanged();
}

void NetworkAssetTransport::loadSettings()
{
    QSettings settings;
    settings.beginGroup(settingsGroup());
    const QString env = settings.value("environment", m_environment).toString();
    if (!env.isEmpty()) {
        m_environment = env;
        m_baseUrl = baseUrlForEnvironment(env);
    }
    const QString customBase = settings.value("baseUrl").toString().trimmed();
    if (!customBase.isEmpty()) {
        const QUrl url(customBase);
        if (url.isValid()) {
            m_baseUrl = url;
        } else {
            qWarning() << "Ignoring invalid api/baseUrl setting:" << customBase;
        }
    }
    m_timeoutMs = qMax(1000, settings.value("timeoutMs", m_timeoutMs).toInt());
    settings.endGroup();
}

void NetworkAssetTransport::saveSettings() const
{
    QSettings settings;
    settings.beginGroup(settingsGroup());
    settings.setValue("environment", m_environment);
    if (m_baseUrl != baseUrlForEnvironment(m_environment)) {
        settings.setValue("baseUrl", m_baseUrl.toString());
    } else {
        settings.remove("baseUrl");
    }
    settings.setValue("timeoutMs", m_timeoutMs);
    settings.endGroup();
}

QNetworkRequest NetworkAssetTransport::apiRequest(const QString& path) const
{
    QString base = m_baseUrl.toString();
    while (base.endsWith('/')) base.chop(1);

    QNetworkRequest req(QUrl(base + path));
    req.setTransferTimeout(m_timeoutMs);
    req.setRawHeader("User-Agent", "skylift/1.0");
    req.setRawHeader("Accept", "application/json");
    req.setHeader(QNetworkRequest::ContentTypeHeader, QByteArray("application/json"));
    req.setRawHeader("X-API-Version", "2023-01-01");
    if (!m_accessToken.isEmpty()) {
        req.setRawHeader("Authorization", QByteArray("Bearer ") + m_accessToken.toUtf8());
    }
    if (!m_tenantId.isEmpty()) {
        req.setRawHeader("picflow-tenant", m_tenantId.toUtf8());
    }
    return req;
}

QNetworkRequest NetworkAssetTransport::storageRequest(const QUrl& url) const
{
    QNetworkRequest req(url);
    req.setTransferTimeout(m_timeoutMs);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    return req;
}

ApiReply* NetworkAssetTransport::track(QNetworkReply* reply, UploadError operationError)
{
    return new NetworkApiReply(reply, operationError);
}

ApiReply* NetworkAssetTransport::postJson(const QString& path, const QByteArray& body, UploadError operationError)
{
    QNetworkRequest req = apiRequest(path);
    return track(m_nam.post(req, body), operationError);
}

ApiReply* NetworkAssetTransport::createAsset(const CreateAssetRequest& request)
{
    const QByteArray body = QJsonDocument(request.toJson()).toJson(QJsonDocument::Compact);
    return postJson(QStringLiteral("/v1/assets"), body, UploadError::AssetRequestFailed);
}

ApiReply* NetworkAssetTransport::uploadPart(const QUrl& url, const QByteArray& data)
{
    QNetworkRequest req = storageRequest(url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, QByteArray("application/octet-stream"));
    req.setHeader(QNetworkRequest::ContentLengthHeader, data.size());
    return track(m_nam.put(req, data), UploadError::ChunkTransferFailed);
}

ApiReply* NetworkAssetTransport::uploadForm(const QUrl& url, const QMap<QString, QString>& fields, const QString& filePath)
{
    auto* file = new QFile(filePath);
    if (!file->open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot open file for upload" << filePath << file->errorString();
        delete file;
        auto* failed = new ApiReply();
        failed->failLater(UploadError::FileReadError, utils::errorDescription(UploadError::FileReadError));
        return failed;
    }

    auto* multiPart = new QHttpMultiPart(QHttpMultiPart::FormDataType);
    for (auto it = fields.cbegin(); it != fields.cend(); ++it) {
        QHttpPart part;
        part.setHeader(QNetworkRequest::ContentDispositionHeader,
                       QStringLiteral("form-data; name=\"%1\"").arg(it.key()));
        part.setBody(it.value().toUtf8());
        multiPart->append(part);
    }

    QHttpPart filePart;
    filePart.setHeader(QNetworkRequest::ContentDispositionHeader,
                       QStringLiteral("form-data; name=\"file\"; filename=\"file\""));
    filePart.setHeader(QNetworkRequest::ContentTypeHeader, QByteArray("application/octet-stream"));
    filePart.setBodyDevice(file);
    file->setParent(multiPart);
    multiPart->append(filePart);

    QNetworkReply* reply = m_nam.post(storageRequest(url), multiPart);
    multiPart->setParent(reply);
    return track(reply, UploadError::SinglePartTransferFailed);
}

ApiReply* NetworkAssetTransport::completeMultipart(const CompleteMultipartRequest& request)
{
    const QByteArray body = QJsonDocument(request.toJson()).toJson(QJsonDocument::Compact);
    return postJson(QStringLiteral("/v1/multipart_uploads/complete"), body, UploadError::MultipartCompletionFailed);
}

ApiReply* NetworkAssetTransport::abortMultipart(const AbortMultipartRequest& request)
{
    const QByteArray body = QJsonDocument(request.toJson()).toJson(QJsonDocument::Compact);
    return postJson(QStringLiteral("/v1/multipart_uploads/abort"), body, UploadError::MultipartCompletionFailed);
}
