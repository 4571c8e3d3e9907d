/*!
 * @file        uploadtask.cppm
 * @brief       Lifecycle of a single file upload.
 * @details     An UploadTask owns one file from the moment it enters the
 *              scheduler until it completes or fails. It creates the asset,
 *              then either posts the whole file as a presigned form
 *              (single part) or hands the part URLs to a
 *              MultipartTransferEngine.
 *
 *              Progress convention: 0.10 once the asset exists, parts fill
 *              up to 0.95, 1.0 when the upload is complete.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QPointer>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module skylift.core.uploadtask;
import skylift.utils.upload_errors;
import skylift.services.asset_models;
import skylift.services.asset_transport;
import skylift.core.concurrencycoordinator;
import skylift.core.multiparttransferengine;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief One file moving through the upload pipeline.
 */
SKYLIFT_MODULE_EXPORT class UploadTask : public QObject {

    Q_OBJECT

    //!< @brief Source file path.
    Q_PROPERTY(QString filePath READ filePath CONSTANT)

    //!< @brief Human-readable task state.
    Q_PROPERTY(QString stateString READ stateString NOTIFY stateChanged)

    //!< @brief Task progress (0.0 – 1.0).
    Q_PROPERTY(double progress READ progress NOTIFY progressChanged)

    //!< @brief Last error message, empty while healthy.
    Q_PROPERTY(QString errorString READ errorString NOTIFY stateChanged)

public:
    enum class State {
        Queued,     //!< Waiting for the scheduler.
        Uploading,  //!< Asset creation or transfer in progress.
        Completed,  //!< Upload finished successfully.
        Failed      //!< Upload failed or was cancelled.
    };

    enum class Strategy {
        SinglePart, //!< One presigned form POST.
        Multipart   //!< Presigned part PUTs plus a completion call.
    };

    /**
     * @brief Construct a task.
     *
     * @param id Unique task identifier.
     * @param filePath Normalized source path.
     * @param size File size in bytes.
     * @param strategy Strategy chosen by the scheduler.
     * @param transport HTTP boundary.
     * @param coordinator Shared slot pool and exclusive lane.
     * @param parent Optional parent QObject.
     */
    UploadTask(const QString& id,
               const QString& filePath,
               qint64 size,
               Strategy strategy,
               AssetTransport* transport,
               ConcurrencyCoordinator* coordinator,
               QObject* parent = nullptr);

    void setGalleryId(const QString& galleryId) { m_galleryId = galleryId; }
    void setSectionId(const QString& sectionId) { m_sectionId = sectionId; }

    /**
     * @brief Base retry delay handed to the multipart engine.
     */
    void setRetryBaseDelayMs(int ms) { m_retryBaseDelayMs = ms; }

    /**
     * @brief Start the upload. The work begins on the next event loop turn.
     */
    void start();

    /**
     * @brief Abort the upload; emits finished(false) if it was running.
     */
    void cancel();

    QString id() const { return m_id; }
    QString filePath() const { return m_filePath; }
    QString fileName() const;
    qint64 size() const { return m_size; }
    Strategy strategy() const { return m_strategy; }
    QString strategyString() const;
    State state() const { return m_state; }
    QString stateString() const;
    double progress() const { return m_progress; }
    qint64 bytesTransferred() const { return m_bytesTransferred; }
    UploadError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    bool isQueued() const { return m_state == State::Queued; }
    bool isRunning() const { return m_state == State::Uploading; }
    bool isFinished() const { return m_state == State::Completed || m_state == State::Failed; }
    bool isMultipart() const { return m_strategy == Strategy::Multipart; }

    /**
     * @brief Engine of a running multipart upload, or nullptr.
     */
    MultipartTransferEngine* engine() const { return m_engine; }

signals:
    void stateChanged();
    void progressChanged(double progress);

    //!< @brief Bytes newly confirmed by the server.
    void bytesTransferredChanged(qint64 delta);

    void finished(bool success);

private:
    void run();
    void onAssetCreated(ApiReply* reply);
    void startSinglePart(const UploadTarget& target);
    void startMultipart(const UploadTarget& target);
    void complete();
    void fail(UploadError error, const QString& message);
    void setState(State state);
    void setProgress(double value);
    void addBytes(qint64 bytes);

    QString m_id;                                   //!< Task identifier
    QString m_filePath;                             //!< Source file
    qint64 m_size = 0;                              //!< File size
    Strategy m_strategy = Strategy::SinglePart;     //!< Transfer strategy
    QString m_galleryId;                            //!< Destination gallery
    QString m_sectionId;                            //!< Optional section
    int m_retryBaseDelayMs = 1000;                  //!< Multipart retry base

    QPointer<AssetTransport> m_transport;           //!< HTTP boundary
    QPointer<ConcurrencyCoordinator> m_coordinator; //!< Slot pool and lane
    QPointer<ApiReply> m_reply;                     //!< Asset or form request
    QPointer<MultipartTransferEngine> m_engine;     //!< Multipart session

    State m_state = State::Queued;                  //!< Current state
    double m_progress = 0.0;                        //!< Current progress
    qint64 m_bytesTransferred = 0;                  //!< Confirmed bytes
    UploadError m_error = UploadError::None;        //!< Last error
    QString m_errorString;                          //!< Last error text
};

#include "uploadtask.moc"
