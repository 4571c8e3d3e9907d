/*!
 * @file        multiparttransferengine.cppm
 * @brief       Chunked upload of one large file to presigned part URLs.
 * @details     Drives a single multipart session from the moment the server
 *              handed out part URLs until the completion call returns:
 *
 *              - waits for the exclusive multipart lane;
 *              - infers the chunk size from the number of part URLs;
 *              - uploads parts through the shared slot pool, reading each
 *                range on the thread pool;
 *              - retries failed parts with exponential backoff;
 *              - submits the sorted ETags to the completion endpoint.
 *
 *              Every exit path (success, failure, cancellation, destruction)
 *              returns held slots and the exclusive lane to the coordinator.
 *              A session that fails or is cancelled after it started sending
 *              parts asks the backend to abort the upload.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QByteArray>
#include <QFutureWatcher>
#include <QList>
#include <QPointer>
#include <QSharedPointer>
#include <QString>
#include <QTimer>
#include <QUrl>
#include <QVector>

#ifndef Q_MOC_RUN
export module skylift.core.multiparttransferengine;
import skylift.utils.upload_errors;
import skylift.services.asset_models;
import skylift.services.asset_transport;
import skylift.core.concurrencycoordinator;
import skylift.core.chunkedfilereader;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief One part of a multipart session.
 */
SKYLIFT_MODULE_EXPORT struct ChunkDescriptor {
    int partNumber = 0;     //!< 1-based part number
    qint64 offset = 0;      //!< First byte of the range
    qint64 length = 0;      //!< Range length; 0 only for a trailing empty part
    QUrl targetUrl;         //!< Presigned PUT URL
};

/**
 * @brief Outcome of reading one chunk on the thread pool.
 */
struct ChunkReadResult {
    QByteArray data;
    UploadError error = UploadError::None;
};

/**
 * @brief Uploads one file as a multipart session.
 *
 * The engine is single use: start() once, then wait for finished().
 */
SKYLIFT_MODULE_EXPORT class MultipartTransferEngine : public QObject {

    Q_OBJECT

    //!< @brief Session progress (0.0 – 1.0).
    Q_PROPERTY(double progress READ progress NOTIFY progressChanged)

    //!< @brief Human-readable session state.
    Q_PROPERTY(QString stateString READ stateString NOTIFY stateChanged)

public:
    enum class State {
        Idle,           //!< Created, start() not called yet.
        Waiting,        //!< Waiting for the exclusive multipart lane.
        Transferring,   //!< Parts are being uploaded.
        Finalizing,     //!< Completion call in flight.
        Completed,      //!< All parts accepted and the upload was completed.
        Failed,         //!< Permanent failure, see error().
        Canceled        //!< cancel() was called.
    };

    /**
     * @brief Construct an engine for one file.
     *
     * @param coordinator Shared slot pool and exclusive lane.
     * @param transport Transport used for part uploads and completion.
     * @param filePath Local file to upload.
     * @param fileSize File size in bytes, as announced to the server.
     * @param target Parsed multipart response (part URLs, upload id, key).
     * @param parent Optional parent QObject.
     */
    MultipartTransferEngine(ConcurrencyCoordinator* coordinator,
                            AssetTransport* transport,
                            const QString& filePath,
                            qint64 fileSize,
                            const UploadTarget& target,
                            QObject* parent = nullptr);
    ~MultipartTransferEngine() override;

    /**
     * @brief Override the ordered chunk size menu (defaults to 10/100/250 MB).
     */
    void setChunkSizeCandidates(const QList<qint64>& candidates);

    /**
     * @brief Delay before the first retry; later retries double it.
     */
    void setRetryBaseDelayMs(int ms);

    /**
     * @brief Number of retries per part after the first attempt.
     */
    void setMaxRetries(int retries);

    /**
     * @brief Begin the session. Has no effect after the first call.
     */
    void start();

    /**
     * @brief Stop all part uploads and release every held resource.
     */
    void cancel();

    State state() const { return m_state; }
    QString stateString() const;
    bool isFinished() const;
    double progress() const { return m_progress; }
    qint64 chunkSize() const { return m_chunkSize; }
    int totalParts() const { return m_chunks.size(); }
    int completedPartCount() const { return m_parts.size(); }
    qint64 bytesUploaded() const { return m_bytesUploaded; }
    QList<ChunkDescriptor> chunks() const;

    /**
     * @brief Finished parts ordered by part number.
     */
    QList<CompletedPart> completedParts() const;

    UploadError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

signals:
    void stateChanged();
    void progressChanged(double progress);

    //!< @brief A part was accepted; bytes is the size of the part.
    void partCompleted(int partNumber, qint64 bytes);

    //!< @brief Bytes newly confirmed by the storage backend.
    void bytesTransferred(qint64 bytes);

    //!< @brief A part failed and will be retried after delayMs.
    void chunkRetryScheduled(int partNumber, int attempt, int delayMs);

    void finished(bool success);

private:
    /**
     * @brief Runtime state of one part.
     */
    struct ChunkState {
        ChunkDescriptor descriptor;                                 //!< Part range and URL
        int attempt = 0;                                            //!< Failed attempts so far
        ConcurrencyCoordinator::Ticket slotTicket = 0;              //!< Pending slot request
        bool holdingSlot = false;                                   //!< Slot granted and not yet returned
        QPointer<ApiReply> reply;                                   //!< PUT in flight
        QTimer* retryTimer = nullptr;                               //!< Backoff timer
        QFutureWatcher<ChunkReadResult>* readWatcher = nullptr;     //!< Read in flight
        QByteArray data;                                            //!< Bytes kept for retries
        bool done = false;                                          //!< ETag recorded
    };

    bool validateTarget();
    void onExclusiveGranted();
    bool buildChunks();
    void requestSlot(int index);
    void onSlotGranted(int index);
    void readChunk(int index);
    void onChunkRead(int index);
    void sendChunk(int index);
    void onChunkReplyFinished(int index, ApiReply* reply);
    void scheduleRetry(int index, UploadError error, const QString& reason);
    void finalize();
    void onFinalizeFinished(ApiReply* reply);

    void releaseChunkSlot(int index);
    void teardownChunks();
    void releaseLane();
    void sendAbort();
    void failSession(UploadError error, const QString& message);
    void setState(State state);
    void setProgress(double value);

    QPointer<ConcurrencyCoordinator> m_coordinator;     //!< Slot pool and lane
    QPointer<AssetTransport> m_transport;               //!< HTTP boundary
    QString m_filePath;                                 //!< Source file
    qint64 m_fileSize = 0;                              //!< Announced size
    UploadTarget m_target;                              //!< Part URLs, upload id, key

    QList<qint64> m_candidates;                         //!< Chunk size menu
    int m_retryBaseDelayMs = 1000;                      //!< First backoff delay
    int m_maxRetries = 3;                               //!< Retries per part

    QSharedPointer<ChunkedFileReader> m_reader;         //!< Shared with worker threads
    QVector<ChunkState> m_chunks;                       //!< One entry per part
    QList<CompletedPart> m_parts;                       //!< Accepted parts
    qint64 m_chunkSize = 0;                             //!< Inferred chunk size
    qint64 m_bytesUploaded = 0;                         //!< Accepted bytes

    ConcurrencyCoordinator::Ticket m_exclusiveTicket = 0;   //!< Pending lane request
    bool m_holdingExclusive = false;                        //!< Lane granted
    bool m_partsStarted = false;                            //!< At least one part was attempted
    QPointer<ApiReply> m_finalizeReply;                     //!< Completion call

    State m_state = State::Idle;                        //!< Session state
    double m_progress = 0.0;                            //!< Session progress
    UploadError m_error = UploadError::None;            //!< Last error
    QString m_errorString;                              //!< Last error text
};

#include "multiparttransferengine.moc"
