/*!
 * @file        uploadscheduler.cppm
 * @brief       Upload queue, strategy selection and progress aggregation.
 * @details     The scheduler is the entry point of the transfer pipeline.
 *              It turns file paths into UploadTask objects, picks single part
 *              or multipart per file, and starts tasks under the queue
 *              policy:
 *
 *              - up to maxConcurrentSmallFiles single part uploads at once;
 *              - at most one multipart upload at a time (the multipart engine
 *                additionally holds the coordinator's exclusive lane);
 *              - a finished task immediately makes room for the next one.
 *
 *              All aggregate state (bytes, progress, speed, ETA) is owned by
 *              the scheduler and only updated from task signals delivered on
 *              its thread.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QElapsedTimer>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QVector>

#ifndef Q_MOC_RUN
export module skylift.core.uploadscheduler;
import skylift.services.asset_transport;
import skylift.core.concurrencycoordinator;
import skylift.core.uploadtask;
import skylift.core.uploadmodel;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief Queue of uploads with smart concurrency and aggregated status.
 */
SKYLIFT_MODULE_EXPORT class UploadScheduler : public QObject {

    Q_OBJECT

    //!< @brief Upload list model.
    Q_PROPERTY(UploadModel* model READ model CONSTANT)

    //!< @brief Queue state: "Idle", "Uploading", "Completed" or "Failed".
    Q_PROPERTY(QString stateString READ stateString NOTIFY statusChanged)

    //!< @brief Size weighted queue progress (0.0 – 1.0), never decreasing.
    Q_PROPERTY(double progress READ progress NOTIFY statusChanged)

    //!< @brief Average speed since the queue started, in bytes per second.
    Q_PROPERTY(double speed READ speed NOTIFY statusChanged)

    //!< @brief Estimated seconds remaining, 0 when unknown.
    Q_PROPERTY(double eta READ eta NOTIFY statusChanged)

    //!< @brief Maximum number of single part uploads running at once.
    Q_PROPERTY(int maxConcurrentSmallFiles READ maxConcurrentSmallFiles WRITE setMaxConcurrentSmallFiles NOTIFY settingsChanged)

    //!< @brief Files strictly larger than this many bytes use multipart.
    Q_PROPERTY(qint64 multipartThreshold READ multipartThreshold WRITE setMultipartThreshold NOTIFY settingsChanged)

    //!< @brief Number of running uploads.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY countsChanged)

    //!< @brief Number of uploads waiting to start.
    Q_PROPERTY(int queuedCount READ queuedCount NOTIFY countsChanged)

public:
    enum class State {
        Idle,       //!< Nothing queued.
        Uploading,  //!< At least one task queued or running.
        Completed,  //!< Queue drained without failures (display delay).
        Failed      //!< Queue drained with at least one failure (display delay).
    };

    /**
     * @brief Construct a scheduler.
     * @param transport HTTP boundary shared by all tasks.
     * @param coordinator Slot pool and exclusive lane shared by all tasks.
     * @param parent Optional parent QObject.
     */
    UploadScheduler(AssetTransport* transport, ConcurrencyCoordinator* coordinator, QObject* parent = nullptr);

    /**
     * @brief Add files to the queue and start them when allowed.
     *
     * Paths already queued or uploading are skipped. Missing files are
     * reported through fileFinished() without creating a task.
     *
     * @param paths Local paths or file URLs.
     * @return Number of tasks created.
     */
    Q_INVOKABLE int enqueue(const QStringList& paths);

    /**
     * @brief Cancel every running upload and drop the queue.
     */
    Q_INVOKABLE void cancelAll();

    /**
     * @brief Whether a task for this path is queued or uploading.
     */
    bool isPending(const QString& path) const;

    UploadModel* model() { return &m_model; }

    void setGalleryId(const QString& galleryId) { m_galleryId = galleryId; }
    QString galleryId() const { return m_galleryId; }
    void setSectionId(const QString& sectionId) { m_sectionId = sectionId; }

    int maxConcurrentSmallFiles() const { return m_maxConcurrentSmallFiles; }
    void setMaxConcurrentSmallFiles(int value);
    qint64 multipartThreshold() const { return m_multipartThreshold; }
    void setMultipartThreshold(qint64 bytes);
    int completionDisplayDelayMs() const { return m_completionDisplayDelayMs; }
    void setCompletionDisplayDelayMs(int ms);

    /**
     * @brief Base chunk retry delay handed to multipart uploads.
     */
    void setRetryBaseDelayMs(int ms) { m_retryBaseDelayMs = ms; }

    State state() const { return m_state; }
    QString stateString() const;
    double progress() const { return m_progress; }
    double speed() const { return m_speed; }
    double eta() const { return m_eta; }
    qint64 totalBytes() const { return m_totalBytes; }
    qint64 transferredBytes() const { return m_transferredBytes; }
    int activeCount() const;
    int queuedCount() const;
    int succeededCount() const { return m_succeeded; }
    int failedCount() const { return m_failed; }

    void loadSettings();
    void saveSettings() const;

signals:
    void statusChanged();
    void countsChanged();
    void settingsChanged();
    void fileStarted(const QString& path);
    void fileFinished(const QString& path, bool success, const QString& errorString);
    void queueFinished(int succeeded, int failed);
    void queueCancelled();

private slots:
    void onTaskFinished(bool success);
    void onTaskBytes(qint64 delta);

private:
    UploadTask* createTask(const QString& path, qint64 size);
    void startQueued();
    void updateTotals();
    void finishQueue();
    void resetQueue();
    void setState(State state);

    UploadModel m_model;                        //!< Task rows
    QVector<UploadTask*> m_queue;               //!< Tasks of the current run
    QPointer<AssetTransport> m_transport;       //!< HTTP boundary
    QPointer<ConcurrencyCoordinator> m_coordinator; //!< Slot pool and lane

    QString m_galleryId;                        //!< Destination gallery
    QString m_sectionId;                        //!< Optional section
    int m_maxConcurrentSmallFiles = 4;          //!< Small file parallelism
    qint64 m_multipartThreshold = 0;            //!< Multipart size threshold
    int m_completionDisplayDelayMs = 2000;      //!< Completed state display time
    int m_retryBaseDelayMs = 1000;              //!< Chunk retry base delay

    State m_state = State::Idle;                //!< Queue state
    qint64 m_totalBytes = 0;                    //!< Bytes in the current run
    qint64 m_transferredBytes = 0;              //!< Confirmed bytes
    double m_progress = 0.0;                    //!< Weighted progress
    double m_speed = 0.0;                       //!< Bytes per second
    double m_eta = 0.0;                         //!< Seconds remaining
    int m_succeeded = 0;                        //!< Finished tasks
    int m_failed = 0;                           //!< Failed tasks
    quint64 m_nextId = 0;                       //!< Task id generator
    bool m_bulkCancelInProgress = false;        //!< cancelAll() re-entrancy guard

    QElapsedTimer m_elapsed;                    //!< Time since the run started
    QTimer m_resetTimer;                        //!< Completion display delay
};

#include "uploadscheduler.moc"
