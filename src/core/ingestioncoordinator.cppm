/*!
 * @file        ingestioncoordinator.cppm
 * @brief       Live folder ingestion on top of FolderWatcher and UploadScheduler.
 * @details     Candidates reported by the watcher are deduplicated by file
 *              name for the lifetime of a watch session, checked for
 *              readiness one at a time per name, and handed to the upload
 *              scheduler. A failed upload is retried a bounded number of
 *              times before the file is marked failed and skipped.
 *
 *              Files coming from a staging folder are removed after a
 *              successful upload. Files in a live folder are left untouched.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QHash>
#include <QPointer>
#include <QSet>
#include <QString>
#include <functional>

#ifndef Q_MOC_RUN
export module skylift.core.ingestioncoordinator;
import skylift.services.watch_backend;
import skylift.core.folderwatcher;
import skylift.core.uploadscheduler;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief Turns files appearing in a watched folder into uploads.
 */
SKYLIFT_MODULE_EXPORT class IngestionCoordinator : public QObject {

    Q_OBJECT

    //!< @brief True while a folder is being watched.
    Q_PROPERTY(bool watching READ isWatching NOTIFY watchingChanged)

    //!< @brief The watched folder, empty when idle.
    Q_PROPERTY(QString watchedFolder READ watchedFolder NOTIFY watchingChanged)

    //!< @brief Files uploaded during the current session.
    Q_PROPERTY(int uploadedCount READ uploadedCount NOTIFY countsChanged)

    //!< @brief Files given up on during the current session.
    Q_PROPERTY(int failedCount READ failedCount NOTIFY countsChanged)

    //!< @brief Human readable activity line.
    Q_PROPERTY(QString statusText READ statusText NOTIFY statusTextChanged)

public:
    enum class FolderPolicy {
        Live,       //!< User folder, files are never deleted.
        Staging     //!< Disposable export folder, files are deleted once uploaded.
    };

    /**
     * @brief Construct a coordinator feeding the given scheduler.
     * @param scheduler Upload queue receiving ready files.
     * @param parent Optional parent QObject.
     */
    explicit IngestionCoordinator(UploadScheduler* scheduler, QObject* parent = nullptr);
    ~IngestionCoordinator();

    /**
     * @brief Start a watch session on a folder, replacing any current one.
     * @param path Folder to watch.
     * @param policy Live or staging behaviour.
     * @param startFromNow Skip files already present regardless of the saved cursor.
     * @return false if the folder cannot be watched.
     */
    Q_INVOKABLE bool selectWatchFolder(const QString& path, FolderPolicy policy = FolderPolicy::Live,
                                       bool startFromNow = false);

    /**
     * @brief End the session and forget every file it has seen.
     */
    Q_INVOKABLE void stopWatching();

    /**
     * @brief Offer a file to the session as if the watcher had detected it.
     * @return false if the file was skipped (duplicate, filtered or no session).
     */
    Q_INVOKABLE bool ingest(const QString& path);

    /**
     * @brief Create a staging folder and clear files left by a previous run.
     * @param path Staging folder.
     * @param error Receives a description on failure.
     */
    static bool prepareStagingFolder(const QString& path, QString* error = nullptr);

    bool isWatching() const { return m_watcher.isWatching(); }
    QString watchedFolder() const { return m_watcher.folder(); }
    FolderPolicy policy() const { return m_policy; }
    int uploadedCount() const { return m_uploadedFiles.size(); }
    int failedCount() const { return m_failedFiles.size(); }
    int processingCount() const { return m_processingFiles.size(); }
    QString statusText() const { return m_statusText; }

    bool wasUploaded(const QString& fileName) const { return m_uploadedFiles.contains(fileName); }
    int attemptsFor(const QString& fileName) const { return m_attempts.value(fileName, 0); }

    int maxRetries() const { return m_maxRetries; }
    void setMaxRetries(int value);
    int retryDelayMs() const { return m_retryDelayMs; }
    void setRetryDelayMs(int ms);

    FolderWatcher* watcher() { return &m_watcher; }
    void setBackendFactory(const std::function<WatchBackend*()>& factory) { m_watcher.setBackendFactory(factory); }
    void setLatencyMs(int ms) { m_watcher.setLatencyMs(ms); }
    void setReadinessIntervalMs(int ms) { m_watcher.setReadinessIntervalMs(ms); }
    void setReadinessMaxAttempts(int attempts) { m_watcher.setReadinessMaxAttempts(attempts); }

    void loadSettings();
    void saveSettings() const;

signals:
    void watchingChanged();
    void countsChanged();
    void statusTextChanged();
    void fileIngested(const QString& path);
    void fileFailed(const QString& path, const QString& errorString);
    void noticeRequested(const QString& message);

private:
    void onCandidate(const QString& path);
    void onFileReady(const QString& path, bool forced);
    void onFileDiscarded(const QString& path, const QString& reason);
    void onUploadFinished(const QString& path, bool success, const QString& errorString);
    void onQueueCancelled();
    bool accepts(const QString& path) const;
    void submit(const QString& path);
    void retryOrFail(const QString& path, const QString& errorString, bool recheck);
    void markFailed(const QString& path, const QString& errorString);
    void finishFile(const QString& fileName);
    void setStatusText(const QString& text);
    void resetSession();

    FolderWatcher m_watcher;                    //!< Notification source
    QPointer<UploadScheduler> m_scheduler;      //!< Upload queue
    FolderPolicy m_policy = FolderPolicy::Live; //!< Current folder policy

    QSet<QString> m_uploadedFiles;              //!< Names uploaded this session
    QSet<QString> m_releasedFiles;              //!< Names handed to the scheduler
    QSet<QString> m_processingFiles;            //!< Names being checked or uploaded
    QSet<QString> m_failedFiles;                //!< Names given up on
    QHash<QString, int> m_attempts;             //!< Failed attempts per name
    QHash<QString, QString> m_submitted;        //!< Path in the scheduler -> name

    int m_maxRetries = 3;                       //!< Attempts per file
    int m_retryDelayMs = 2000;                  //!< Delay between attempts
    quint64 m_session = 0;                      //!< Watch session generation
    QString m_statusText;                       //!< Activity line
};

#include "ingestioncoordinator.moc"
