/*!
 * @file        folderwatcher.cppm
 * @brief       Watched folder with event filtering and readiness checks.
 * @details     FolderWatcher turns raw backend notifications for one
 *              directory into "this file is ready to upload" decisions:
 *
 *              Idle -> Watching -> CandidateDetected -> ReadinessChecking ->
 *              { Released | ForcedRelease | Discarded }
 *
 *              Notifications are coalesced into batches, filtered (exact
 *              parent folder, no hidden or transient names, creations and
 *              renames of regular files only) and then checked for
 *              stability: the file size is sampled every interval and the
 *              file is released once two consecutive samples match and the
 *              file opens for reading. A file that never settles is released
 *              anyway after the attempt budget; a file that disappears is
 *              discarded.
 *
 *              Notification delivery and readiness polling each run on their
 *              own low priority thread. A per-folder event cursor is kept in
 *              QSettings so a restarted watcher catches up on files that
 *              arrived while it was stopped, without replaying old ones.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <functional>
#include <QObject>
#include <QHash>
#include <QSet>
#include <QString>
#include <QThread>
#include <QTimer>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module skylift.core.folderwatcher;
import skylift.services.watch_backend;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief Samples candidate files until they stop growing.
 *
 * Lives on its own thread. Each path has at most one record; a second
 * check() for a path that is already being sampled is ignored.
 */
SKYLIFT_MODULE_EXPORT class ReadinessChecker : public QObject {

    Q_OBJECT

public:
    explicit ReadinessChecker(QObject* parent = nullptr);

    void setIntervalMs(int ms) { m_intervalMs = qMax(1, ms); }
    int intervalMs() const { return m_intervalMs; }
    void setMaxAttempts(int attempts) { m_maxAttempts = qMax(1, attempts); }
    int maxAttempts() const { return m_maxAttempts; }
    int pendingCount() const { return m_records.size(); }

public slots:
    /**
     * @brief Start sampling a file. The first sample is taken one interval later.
     * @param path Absolute file path.
     * @param generation Session generation echoed in the result signals.
     */
    void check(const QString& path, quint64 generation);

    /**
     * @brief Stop every pending check without emitting results.
     */
    void cancelAll();

signals:
    /**
     * @brief File is ready; forced is true when the attempt budget ran out.
     */
    void fileReady(const QString& path, bool forced, quint64 generation);

    void fileDiscarded(const QString& path, const QString& reason, quint64 generation);

private:
    /**
     * @brief Sampling state of one candidate file.
     */
    struct Record {
        qint64 lastSize = -1;       //!< Previous size sample
        int sampleCount = 0;        //!< Samples taken
        int attempts = 0;           //!< Stability comparisons made
        quint64 generation = 0;     //!< Session generation
        QTimer* timer = nullptr;    //!< Next sample
    };

    void sample(const QString& path);
    void finish(const QString& path);

    QHash<QString, Record> m_records;   //!< Pending checks, keyed by path
    int m_intervalMs = 500;             //!< Sampling interval
    int m_maxAttempts = 6;              //!< Comparisons before forcing release
};

/**
 * @brief Watches one folder and reports files that are ready to upload.
 */
SKYLIFT_MODULE_EXPORT class FolderWatcher : public QObject {

    Q_OBJECT

    //!< @brief Watched folder, empty while idle.
    Q_PROPERTY(QString folder READ folder NOTIFY watchingChanged)

    //!< @brief Whether a folder is being watched.
    Q_PROPERTY(bool watching READ isWatching NOTIFY watchingChanged)

public:
    using BackendFactory = std::function<WatchBackend*()>;

    explicit FolderWatcher(QObject* parent = nullptr);
    ~FolderWatcher() override;

    /**
     * @brief Replace the backend factory (default: WatchBackend::createDefault).
     */
    void setBackendFactory(BackendFactory factory);

    /**
     * @brief When enabled (default), every candidate is checked automatically.
     *
     * Disable it to filter candidates first and call checkReadiness() yourself.
     */
    void setAutoCheckReadiness(bool enabled) { m_autoCheck = enabled; }

    void setLatencyMs(int ms);
    void setReadinessIntervalMs(int ms) { m_readinessIntervalMs = qMax(1, ms); }
    void setReadinessMaxAttempts(int attempts) { m_readinessMaxAttempts = qMax(1, attempts); }

    /**
     * @brief Start watching a folder.
     *
     * @param folder Directory to watch (not recursive).
     * @param startFromNow Ignore a saved cursor and skip files already present.
     * @return false if the folder does not exist or no backend could watch it.
     */
    bool start(const QString& folder, bool startFromNow = false);

    /**
     * @brief Stop watching and cancel every pending readiness check.
     */
    void stop();

    /**
     * @brief Queue a readiness check for a file.
     * @return false if a check for this path is already running.
     */
    bool checkReadiness(const QString& path);

    bool isWatching() const { return !m_folder.isEmpty(); }
    QString folder() const { return m_folder; }
    QString backendName() const;
    quint64 lastEventCursor() const { return m_cursor; }
    int pendingReadinessCount() const { return m_pendingChecks.size(); }
    bool isCheckPending(const QString& path) const { return m_pendingChecks.contains(path); }

    /**
     * @brief Cursor persisted for a folder, 0 if none.
     */
    static quint64 savedCursor(const QString& folder);

    /**
     * @brief Forget the persisted cursor of a folder.
     */
    static void resetCursor(const QString& folder);

signals:
    void watchingChanged();
    void candidateDetected(const QString& path);
    void fileReady(const QString& path, bool forced);
    void fileDiscarded(const QString& path, const QString& reason);
    void errorOccurred(const QString& message);

private:
    /**
     * @brief Raw event waiting for the next batch.
     */
    struct PendingEvent {
        QString path;
        int flags = 0;
        quint64 id = 0;
    };

    bool startBackend(WatchBackend* backend, const QString& path);
    void stopBackend();
    void onBackendEvent(const QString& path, int flags, quint64 eventId);
    void processBatch();
    void catchUp(quint64 cursor);
    bool acceptEvent(const PendingEvent& event) const;
    void advanceCursor(quint64 cursor);
    void onReady(const QString& path, bool forced, quint64 generation);
    void onDiscarded(const QString& path, const QString& reason, quint64 generation);

    BackendFactory m_factory;                   //!< Backend constructor
    WatchBackend* m_backend = nullptr;          //!< Lives on m_eventThread
    ReadinessChecker* m_checker = nullptr;      //!< Lives on m_readinessThread
    QThread m_eventThread;                      //!< Notification delivery
    QThread m_readinessThread;                  //!< Readiness polling

    QString m_folder;                           //!< Watched folder
    quint64 m_cursor = 0;                       //!< Last processed event id
    quint64 m_generation = 0;                   //!< Session generation
    bool m_autoCheck = true;                    //!< Check candidates automatically
    int m_readinessIntervalMs = 500;            //!< Readiness sampling interval
    int m_readinessMaxAttempts = 6;             //!< Readiness attempt budget

    QVector<PendingEvent> m_batch;              //!< Coalescing buffer
    QTimer m_latencyTimer;                      //!< Batch latency
    QSet<QString> m_pendingChecks;              //!< Paths being checked
};

#include "folderwatcher.moc"
