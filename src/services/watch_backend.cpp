module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QSocketNotifier>
#include <QString>
#include <QTimer>
#include <QtGlobal>

#if defined(Q_OS_LINUX)
#include <cerrno>
#include <cstring>
#include <sys/inotify.h>
#include <unistd.h>
#endif

module skylift.services.watch_backend;

// ---------------------------------------------------------------------------
// WatchBackend

WatchBackend::WatchBackend(QObject* parent)
    : QObject(parent)
{
}

quint64 WatchBackend::nextEventId()
{
    const quint64 now = static_cast<quint64>(QDateTime::currentMSecsSinceEpoch());
    m_lastEventId = qMax(now, m_lastEventId + 1);
    return m_lastEventId;
}

WatchBackend* WatchBackend::createDefault()
{
#if defined(Q_OS_LINUX)
    return new InotifyWatchBackend();
#else
    return new PollingWatchBackend();
#endif
}

// ---------------------------------------------------------------------------
// InotifyWatchBackend

InotifyWatchBackend::InotifyWatchBackend(QObject* parent)
    : WatchBackend(parent)
{
}

InotifyWatchBackend::~InotifyWatchBackend()
{
    stop();
}

bool InotifyWatchBackend::start(const QString& directory)
{
#if defined(Q_OS_LINUX)
    stop();
    m_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_fd < 0) {
        qWarning() << "inotify_init1 failed:" << std::strerror(errno);
        return false;
    }

    const QByteArray native = QFile::encodeName(directory);
    const uint32_t mask = IN_CREATE | IN_MOVED_TO | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM | IN_ONLYDIR;
    m_wd = inotify_add_watch(m_fd, native.constData(), mask);
    if (m_wd < 0) {
        qWarning() << "inotify_add_watch failed for" << directory << std::strerror(errno);
        ::close(m_fd);
        m_fd = -1;
        return false;
    }

    m_directory = QDir::cleanPath(directory);
    m_notifier = new QSocketNotifier(m_fd, QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &InotifyWatchBackend::readEvents);
    return true;
#else
    Q_UNUSED(directory)
    return false;
#endif
}

void InotifyWatchBackend::stop()
{
#if defined(Q_OS_LINUX)
    if (m_notifier) {
        m_notifier->setEnabled(false);
        delete m_notifier;
    }
    if (m_fd >= 0) {
        if (m_wd >= 0) inotify_rm_watch(m_fd, m_wd);
        ::close(m_fd);
    }
#endif
    m_fd = -1;
    m_wd = -1;
}

void InotifyWatchBackend::readEvents()
{
#if defined(Q_OS_LINUX)
    alignas(struct inotify_event) char buffer[8192];
    for (;;) {
        const ssize_t length = ::read(m_fd, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                emit errorOccurred(QStringLiteral("inotify read failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno))));
            }
            return;
        }
        if (length == 0) return;

        for (char* ptr = buffer; ptr < buffer + length;) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                qWarning() << "inotify queue overflow on" << m_directory;
                emit overflowed();
                continue;
            }
            if (event->mask & IN_IGNORED) {
                emit errorOccurred(QStringLiteral("Watch removed for %1").arg(m_directory));
                continue;
            }
            if (event->len == 0) continue;

            int flags = 0;
            if (event->mask & IN_CREATE) flags |= ItemCreated;
            if (event->mask & IN_MOVED_TO) flags |= ItemRenamed;
            if (event->mask & IN_CLOSE_WRITE) flags |= ItemModified;
            if (event->mask & IN_DELETE) flags |= ItemRemoved;
            if (event->mask & IN_MOVED_FROM) flags |= ItemRenamed | ItemRemoved;
            flags |= (event->mask & IN_ISDIR) ? ItemIsDir : ItemIsFile;

            const QString name = QFile::decodeName(event->name);
            emit eventReceived(m_directory + QLatin1Char('/') + name, flags, nextEventId());
        }
    }
#endif
}

// ---------------------------------------------------------------------------
// PollingWatchBackend

PollingWatchBackend::PollingWatchBackend(int intervalMs, QObject* parent)
    : WatchBackend(parent)
    , m_intervalMs(qMax(100, intervalMs))
{
}

bool PollingWatchBackend::start(const QString& directory)
{
    stop();
    const QFileInfo info(directory);
    if (!info.exists() || !info.isDir()) {
        qWarning() << "Polling watcher: not a directory" << directory;
        return false;
    }

    m_directory = QDir::cleanPath(info.absoluteFilePath());
    m_entries = snapshot();

    m_watcher = new QFileSystemWatcher(this);
    if (!m_watcher->addPath(m_directory)) {
        qDebug() << "Polling watcher: QFileSystemWatcher unavailable, timer only";
    }
    connect(m_watcher, &QFileSystemWatcher::directoryChanged, this, &PollingWatchBackend::rescan);

    m_timer = new QTimer(this);
    m_timer->setInterval(m_intervalMs);
    connect(m_timer, &QTimer::timeout, this, &PollingWatchBackend::rescan);
    m_timer->start();
    return true;
}

void PollingWatchBackend::stop()
{
    if (m_timer) {
        m_timer->stop();
        delete m_timer;
    }
    if (m_watcher) delete m_watcher;
    m_entries.clear();
}

QHash<QString, PollingWatchBackend::Entry> PollingWatchBackend::snapshot() const
{
    QHash<QString, Entry> entries;
    const QDir dir(m_directory);
    const QFileInfoList list = dir.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
    for (const QFileInfo& fi : list) {
        Entry e;
        e.size = fi.size();
        e.modified = fi.lastModified().toMSecsSinceEpoch();
        e.isDir = fi.isDir();
        entries.insert(fi.fileName(), e);
    }
    return entries;
}

void PollingWatchBackend::rescan()
{
    if (m_directory.isEmpty()) return;
    const QHash<QString, Entry> current = snapshot();

    for (auto it = current.cbegin(); it != current.cend(); ++it) {
        const int kind = it.value().isDir ? ItemIsDir : ItemIsFile;
        const auto previous = m_entries.constFind(it.key());
        if (previous == m_entries.cend()) {
            emit eventReceived(m_directory + QLatin1Char('/') + it.key(), ItemCreated | kind, nextEventId());
        } else if (previous->size != it.value().size || previous->modified != it.value().modified) {
            emit eventReceived(m_directory + QLatin1Char('/') + it.key(), ItemModified | kind, nextEventId());
        }
    }
    for (auto it = m_entries.cbegin(); it != m_entries.cend(); ++it) {
        if (!current.contains(it.key())) {
            const int kind = it.value().isDir ? ItemIsDir : ItemIsFile;
            emit eventReceived(m_directory + QLatin1Char('/') + it.key(), ItemRemoved | kind, nextEventId());
        }
    }
    m_entries = current;
}
