/*!
 * @file        watch_backend.cppm
 * @brief       Directory change notification backends.
 * @details     A WatchBackend reports raw change events for one directory.
 *              It knows nothing about uploads: filtering, coalescing, the
 *              event cursor and the readiness check all live in FolderWatcher.
 *
 *              Two implementations are provided:
 *              - InotifyWatchBackend, the native Linux notification API;
 *              - PollingWatchBackend, a portable snapshot diff driven by a
 *                timer and QFileSystemWatcher.
 *
 *              Backends are started and stopped on the thread they live in.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QDateTime>
#include <QFileSystemWatcher>
#include <QHash>
#include <QPointer>
#include <QSocketNotifier>
#include <QString>
#include <QTimer>

#ifndef Q_MOC_RUN
export module skylift.services.watch_backend;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief Source of raw change events for one directory.
 */
SKYLIFT_MODULE_EXPORT class WatchBackend : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Event flags carried by eventReceived().
     */
    enum EventFlag {
        ItemCreated  = 0x01,    //!< Entry was created in the directory
        ItemRenamed  = 0x02,    //!< Entry was moved into (or out of) the directory
        ItemModified = 0x04,    //!< Entry content changed or was closed after writing
        ItemRemoved  = 0x08,    //!< Entry was deleted
        ItemIsFile   = 0x10,    //!< Entry is a regular file
        ItemIsDir    = 0x20     //!< Entry is a directory
    };

    explicit WatchBackend(QObject* parent = nullptr);

    /**
     * @brief Begin watching a directory. Must run on the backend's thread.
     * @return false if the directory cannot be watched.
     */
    virtual bool start(const QString& directory) = 0;

    /**
     * @brief Stop watching. Must run on the backend's thread.
     */
    virtual void stop() = 0;

    /**
     * @brief Short backend name for logs, e.g. "inotify".
     */
    virtual QString name() const = 0;

    QString directory() const { return m_directory; }

    /**
     * @brief Next event identifier: wall clock milliseconds, strictly increasing.
     */
    quint64 nextEventId();

    /**
     * @brief Native backend for this platform, or the polling backend.
     */
    static WatchBackend* createDefault();

signals:
    /**
     * @brief One change notification.
     * @param path Absolute path of the entry.
     * @param flags Combination of EventFlag values.
     * @param eventId Identifier from nextEventId().
     */
    void eventReceived(const QString& path, int flags, quint64 eventId);

    //!< @brief Events may have been lost; consumers should rescan.
    void overflowed();

    void errorOccurred(const QString& message);

protected:
    QString m_directory;            //!< Watched directory

private:
    quint64 m_lastEventId = 0;      //!< Last identifier handed out
};

/**
 * @brief Linux inotify backend.
 *
 * Watches IN_CREATE, IN_MOVED_TO, IN_CLOSE_WRITE, IN_DELETE and
 * IN_MOVED_FROM on a single directory, without recursion.
 */
SKYLIFT_MODULE_EXPORT class InotifyWatchBackend : public WatchBackend {

    Q_OBJECT

public:
    explicit InotifyWatchBackend(QObject* parent = nullptr);
    ~InotifyWatchBackend() override;

    bool start(const QString& directory) override;
    void stop() override;
    QString name() const override { return QStringLiteral("inotify"); }

private:
    void readEvents();

    int m_fd = -1;                              //!< inotify instance
    int m_wd = -1;                              //!< Watch descriptor
    QPointer<QSocketNotifier> m_notifier;       //!< Readability notifier on m_fd
};

/**
 * @brief Portable backend diffing directory snapshots.
 *
 * A QFileSystemWatcher triggers an immediate rescan; the timer catches
 * anything the watcher misses.
 */
SKYLIFT_MODULE_EXPORT class PollingWatchBackend : public WatchBackend {

    Q_OBJECT

public:
    explicit PollingWatchBackend(int intervalMs = 1000, QObject* parent = nullptr);

    bool start(const QString& directory) override;
    void stop() override;
    QString name() const override { return QStringLiteral("polling"); }

private:
    /**
     * @brief Snapshot entry of one directory item.
     */
    struct Entry {
        qint64 size = 0;
        qint64 modified = 0;
        bool isDir = false;
    };

    QHash<QString, Entry> snapshot() const;
    void rescan();

    int m_intervalMs = 1000;                    //!< Poll interval
    QPointer<QTimer> m_timer;                   //!< Poll timer
    QPointer<QFileSystemWatcher> m_watcher;     //!< Change trigger
    QHash<QString, Entry> m_entries;            //!< Last snapshot, keyed by name
};

#include "watch_backend.moc"
