/*!
 * @file        asset_transport.cppm
 * @brief       HTTP boundary of the transfer pipeline.
 * @details     Declares the asynchronous reply object returned by every
 *              request, the abstract AssetTransport interface the core talks
 *              to, and NetworkAssetTransport, the QNetworkAccessManager based
 *              implementation used by the application.
 *
 *              API calls carry the JSON content headers, the API version,
 *              the bearer token and the tenant header. Presigned storage
 *              URLs (part PUTs and form POSTs) are sent without them.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QByteArray>
#include <QHash>
#include <QMap>
#include <QString>
#include <QUrl>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>

#ifndef Q_MOC_RUN
export module skylift.services.asset_transport;
import skylift.utils.upload_errors;
import skylift.services.asset_models;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief Result of one asynchronous transport request.
 *
 * finished() is emitted exactly once, never from inside the call that
 * created the reply. The receiver owns the reply and should deleteLater()
 * it after finished().
 */
SKYLIFT_MODULE_EXPORT class ApiReply : public QObject {

    Q_OBJECT

public:
    explicit ApiReply(QObject* parent = nullptr);

    int statusCode() const { return m_status; }
    QByteArray body() const { return m_body; }

    /**
     * @brief Returns a response header value; names are case-insensitive.
     */
    QByteArray header(const QByteArray& name) const;

    /**
     * @brief Transport level error (Timeout, Cancelled, or the operation
     *        error chosen by the transport). None when an HTTP response arrived.
     */
    UploadError error() const { return m_error; }
    QString errorString() const { return m_errorString; }
    bool isFinished() const { return m_finished; }

    /**
     * @brief Finished with a 2xx status and no transport error.
     */
    bool isSuccess() const;

    /**
     * @brief Maps the outcome to the error of the calling operation.
     *
     * Timeouts and cancellation keep their own kind; every other failure,
     * including non-2xx statuses, is reported as operationError.
     */
    UploadError errorFor(UploadError operationError) const;

    /**
     * @brief Abort the request. Emits finished() with Cancelled unless it
     *        already finished.
     */
    virtual void abort();

    /**
     * @brief Complete with an HTTP response.
     */
    void finish(int status, const QByteArray& body, const QHash<QByteArray, QByteArray>& headers = {});

    /**
     * @brief Complete with a transport failure (no HTTP response).
     */
    void fail(UploadError error, const QString& message);

    /**
     * @brief Schedule fail() on the event loop.
     */
    void failLater(UploadError error, const QString& message);

signals:
    void finished();
    void uploadProgress(qint64 bytesSent, qint64 bytesTotal);

private:
    int m_status = 0;                           //!< HTTP status, 0 without response
    QByteArray m_body;                          //!< Response body
    QHash<QByteArray, QByteArray> m_headers;    //!< Lower-cased header names
    UploadError m_error = UploadError::None;    //!< Transport error
    QString m_errorString;                      //!< Human readable error
    bool m_finished = false;                    //!< finished() already emitted
};

/**
 * @brief Calls the core issues against the asset service and storage.
 *
 * Implementations create ApiReply objects that complete asynchronously.
 */
SKYLIFT_MODULE_EXPORT class AssetTransport : public QObject {

    Q_OBJECT

public:
    explicit AssetTransport(QObject* parent = nullptr);

    /**
     * @brief POST /v1/assets.
     */
    virtual ApiReply* createAsset(const CreateAssetRequest& request) = 0;

    /**
     * @brief PUT one part to a presigned URL as application/octet-stream.
     */
    virtual ApiReply* uploadPart(const QUrl& url, const QByteArray& data) = 0;

    /**
     * @brief POST a whole file as multipart/form-data with presigned fields.
     * @param url Form target.
     * @param fields Form fields, sent in key order before the file.
     * @param filePath File sent under the "file" field.
     */
    virtual ApiReply* uploadForm(const QUrl& url, const QMap<QString, QString>& fields, const QString& filePath) = 0;

    /**
     * @brief POST /v1/multipart_uploads/complete.
     */
    virtual ApiReply* completeMultipart(const CompleteMultipartRequest& request) = 0;

    /**
     * @brief POST /v1/multipart_uploads/abort.
     */
    virtual ApiReply* abortMultipart(const AbortMultipartRequest& request) = 0;
};

/**
 * @brief AssetTransport backed by QNetworkAccessManager.
 *
 * Base URL and timeout come from the "api" settings group; the access token
 * and tenant are supplied by the caller and never persisted.
 */
SKYLIFT_MODULE_EXPORT class NetworkAssetTransport : public AssetTransport {

    Q_OBJECT

    //!< @brief API root, e.g. https://picflow.com/api.
    Q_PROPERTY(QUrl baseUrl READ baseUrl WRITE setBaseUrl NOTIFY configurationChanged)

    //!< @brief Inactivity timeout applied to every request, in milliseconds.
    Q_PROPERTY(int timeoutMs READ timeoutMs WRITE setTimeoutMs NOTIFY configurationChanged)

public:
    explicit NetworkAssetTransport(QObject* parent = nullptr);

    ApiReply* createAsset(const CreateAssetRequest& request) override;
    ApiReply* uploadPart(const QUrl& url, const QByteArray& data) override;
    ApiReply* uploadForm(const QUrl& url, const QMap<QString, QString>& fields, const QString& filePath) override;
    ApiReply* completeMultipart(const CompleteMultipartRequest& request) override;
    ApiReply* abortMultipart(const AbortMultipartRequest& request) override;

    QUrl baseUrl() const { return m_baseUrl; }
    void setBaseUrl(const QUrl& url);

    /**
     * @brief Select "production" or "development".
     */
    void setEnvironment(const QString& environment);

    /**
     * @brief Returns the API root for an environment name.
     */
    static QUrl baseUrlForEnvironment(const QString& environment);

    int timeoutMs() const { return m_timeoutMs; }
    void setTimeoutMs(int ms);

    void setAccessToken(const QString& token) { m_accessToken = token; }
    void setTenantId(const QString& tenantId) { m_tenantId = tenantId; }

    void loadSettings();
    void saveSettings() const;

signals:
    void configurationChanged();

private:
    QNetworkRequest apiRequest(const QString& path) const;
    QNetworkRequest storageRequest(const QUrl& url) const;
    ApiReply* track(QNetworkReply* reply, UploadError operationError);
    ApiReply* postJson(const QString& path, const QByteArray& body, UploadError operationError);

    QNetworkAccessManager m_nam;        //!< Shared network access manager
    QUrl m_baseUrl;                     //!< API root
    QString m_environment;              //!< Environment name for persistence
    int m_timeoutMs = 30000;            //!< Transfer timeout
    QString m_accessToken;              //!< Bearer token
    QString m_tenantId;                 //!< Tenant header value
};

#include "asset_transport.moc"
