module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMetaObject>
#include <QSettings>
#include <QThread>
#include <QSet>
#include <QTimer>
#include <QVector>
#include <algorithm>

module skylift.core.folderwatcher;

import skylift.utils.file_filters;
import skylift.utils.upload_utils;
import skylift.services.watch_backend;

namespace utils = skylift::utils;

static QString cursorKey(const QString& folder)
{
    return QStringLiteral("watcher/cursors/") + utils::settingsKeyForPath(folder);
}

/**
 * @brief Time a file arrived in its folder, in milliseconds, never later than now.
 *
 * A rename keeps the modification time but updates the metadata change time,
 * so the later of the two is used. Modification times in the future are
 * ignored.
 */
static qint64 arrivalStamp(const QFileInfo& fi)
{
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    qint64 stamp = 0;
    const QDateTime changed = fi.metadataChangeTime();
    if (changed.isValid()) stamp = changed.toMSecsSinceEpoch();
    const QDateTime modified = fi.lastModified();
    if (modified.isValid() && modified.toMSecsSinceEpoch() <= now) {
        stamp = qMax(stamp, modified.toMSecsSinceEpoch());
    }
    return qMin(stamp, now);
}

// ---------------------------------------------------------------------------
// ReadinessChecker

ReadinessChecker::ReadinessChecker(QObject* parent)
    : QObject(parent)
{
}

void ReadinessChecker::check(const QString& path, quint64 generation)
{
    if (m_records.contains(path)) return;

    Record record;
    record.generation = generation;
    record.timer = new QTimer(this);
    record.timer->setSingleShot(true);
    connect(record.timer, &QTimer::timeout, this, [this, path]() { sample(path); });
    record.timer->start(m_intervalMs);
    m_records.insert(path, record);
}

void ReadinessChecker::sample(const QString& path)
{
    auto it = m_records.find(path);
    if (it == m_records.end()) return;
    Record& record = it.value();

    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        const quint64 generation = record.generation;
        finish(path);
        emit fileDiscarded(path, QStringLiteral("disappeared"), generation);
        return;
    }

    QFile file(path);
    const bool readable = file.open(QIODevice::ReadOnly);
    file.close();
    const qint64 size = info.size();

    if (record.sampleCount == 0) {
        record.lastSize = size;
        record.sampleCount = 1;
        record.timer->start(m_intervalMs);
        return;
    }

    record.attempts++;
    if (readable && size > 0 && size == record.lastSize) {
        const quint64 generation = record.generation;
        qDebug() << "Readiness: stable" << info.fileName() << size << "bytes after" << record.attempts << "checks";
        finish(path);
        emit fileReady(path, false, generation);
        return;
    }

    if (record.attempts >= m_maxAttempts) {
        const quint64 generation = record.generation;
        finish(path);
        if (!readable) {
            qWarning() << "Readiness: giving up on unreadable file" << path;
            emit fileDiscarded(path, QStringLiteral("unreadable"), generation);
        } else {
            qWarning() << "Readiness: releasing unsettled file after" << m_maxAttempts << "checks:" << path;
            emit fileReady(path, true, generation);
        }
        return;
    }

    record.lastSize = size;
    record.sampleCount++;
    record.timer->start(m_intervalMs);
}

void ReadinessChecker::finish(const QString& path)
{
    const Record record = m_records.take(path);
    if (record.timer) {
        record.timer->stop();
        record.timer->deleteLater();
    }
}

void ReadinessChecker::cancelAll()
{
    for (auto it = m_records.begin(); it != m_records.end(); ++it) {
        if (it->timer) {
            it->timer->stop();
            it->timer->deleteLater();
        }
    }
    m_records.clear();
}

// ---------------------------------------------------------------------------
// FolderWatcher

FolderWatcher::FolderWatcher(QObject* parent)
    : QObject(parent)
    , m_factory([]() { return WatchBackend::createDefault(); })
{
    m_latencyTimer.setSingleShot(true);
    m_latencyTimer.setInterval(500);
    connect(&m_latencyTimer, &QTimer::timeout, this, &FolderWatcher::processBatch);
}

FolderWatcher::~FolderWatcher()
{
    stop();
}

void FolderWatcher::setBackendFactory(BackendFactory factory)
{
    if (factory) m_factory = std::move(factory);
}

void FolderWatcher::setLatencyMs(int ms)
{
    m_latencyTimer.setInterval(qMax(0, ms));
}

QString FolderWatcher::backendName() const
{
    return m_backend ? m_backend->name() : QString();
}

bool FolderWatcher::start(const QString& folder, bool startFromNow)
{
    stop();

    const QString path = utils::normalizeFilePath(folder);
    const QFileInfo info(path);
    if (path.isEmpty() || !info.exists() || !info.isDir()) {
        qWarning() << "FolderWatcher: not a directory" << folder;
        emit errorOccurred(QStringLiteral("Folder does not exist: %1").arg(folder));
        return false;
    }

    WatchBackend* backend = m_factory();
    const QString backendName = backend ? backend->name() : QString();
    if (!startBackend(backend, path)) {
        if (backendName == QLatin1String("polling")) {
            emit errorOccurred(QStringLiteral("Cannot watch %1").arg(path));
            return false;
        }
        qWarning() << "FolderWatcher:" << backendName << "unavailable, falling back to polling";
        if (!startBackend(new PollingWatchBackend(), path)) {
            emit errorOccurred(QStringLiteral("Cannot watch %1").arg(path));
            return false;
        }
    }

    m_folder = path;
    ++m_generation;

    m_checker = new ReadinessChecker();
    m_checker->setIntervalMs(m_readinessIntervalMs);
    m_checker->setMaxAttempts(m_readinessMaxAttempts);
    m_checker->moveToThread(&m_readinessThread);
    connect(m_checker, &ReadinessChecker::fileReady, this, &FolderWatcher::onReady);
    connect(m_checker, &ReadinessChecker::fileDiscarded, this, &FolderWatcher::onDiscarded);
    if (!m_readinessThread.isRunning()) m_readinessThread.start(QThread::LowPriority);

    qInfo() << "Watching" << m_folder << "using" << m_backend->name();
    emit watchingChanged();

    const quint64 saved = savedCursor(m_folder);
    if (startFromNow || saved == 0) {
        advanceCursor(static_cast<quint64>(QDateTime::currentMSecsSinceEpoch()));
    } else {
        m_cursor = saved;
        catchUp(saved);
    }
    return true;
}

bool FolderWatcher::startBackend(WatchBackend* backend, const QString& path)
{
    if (!backend) return false;
    backend->setParent(nullptr);
    backend->moveToThread(&m_eventThread);
    if (!m_eventThread.isRunning()) m_eventThread.start(QThread::LowPriority);

    bool ok = false;
    QMetaObject::invokeMethod(backend, [backend, path, &ok]() { ok = backend->start(path); },
                              Qt::BlockingQueuedConnection);
    if (!ok) {
        backend->deleteLater();
        return false;
    }

    m_backend = backend;
    connect(backend, &WatchBackend::eventReceived, this, &FolderWatcher::onBackendEvent);
    connect(backend, &WatchBackend::overflowed, this, [this]() { catchUp(m_cursor); });
    connect(backend, &WatchBackend::errorOccurred, this, &FolderWatcher::errorOccurred);
    return true;
}

void FolderWatcher::stopBackend()
{
    if (!m_backend) return;
    WatchBackend* backend = m_backend;
    m_backend = nullptr;
    disconnect(backend, nullptr, this, nullptr);
    QMetaObject::invokeMethod(backend, [backend]() { backend->stop(); }, Qt::BlockingQueuedConnection);
    backend->deleteLater();
}

void FolderWatcher::stop()
{
    m_latencyTimer.stop();
    m_batch.clear();
    ++m_generation;

    if (m_checker) {
        ReadinessChecker* checker = m_checker;
        m_checker = nullptr;
        disconnect(checker, nullptr, this, nullptr);
        // Blocking: no readiness timer of this session may fire after stop() returns.
        QMetaObject::invokeMethod(checker, [checker]() { checker->cancelAll(); }, Qt::BlockingQueuedConnection);
        checker->deleteLater();
    }
    stopBackend();

    if (m_readinessThread.isRunning()) {
        m_readinessThread.quit();
        m_readinessThread.wait();
    }
    if (m_eventThread.isRunning()) {
        m_eventThread.quit();
        m_eventThread.wait();
    }

    m_pendingChecks.clear();
    const bool wasWatching = isWatching();
    m_folder.clear();
    m_cursor = 0;
    if (wasWatching) {
        qInfo() << "Stopped watching";
        emit watchingChanged();
    }
}

bool FolderWatcher::checkReadiness(const QString& path)
{
    if (!m_checker || m_pendingChecks.contains(path)) return false;
    m_pendingChecks.insert(path);

    ReadinessChecker* checker = m_checker;
    const quint64 generation = m_generation;
    QMetaObject::invokeMethod(checker, [checker, path, generation]() { checker->check(path, generation); },
                              Qt::QueuedConnection);
    return true;
}

void FolderWatcher::onBackendEvent(const QString& path, int flags, quint64 eventId)
{
    if (!isWatching()) return;
    PendingEvent event;
    event.path = path;
    event.flags = flags;
    event.id = eventId;
    m_batch.append(event);
    if (!m_latencyTimer.isActive()) m_latencyTimer.start();
}

void FolderWatcher::catchUp(quint64 cursor)
{
    if (!isWatching()) return;
    const QDir dir(m_folder);
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                                                    QDir::Name);
    QVector<PendingEvent> missed;
    for (const QFileInfo& fi : entries) {
        const qint64 arrived = arrivalStamp(fi);
        if (arrived <= 0 || static_cast<quint64>(arrived) <= cursor) continue;
        PendingEvent event;
        event.path = QDir::cleanPath(fi.absoluteFilePath());
        event.flags = WatchBackend::ItemCreated | WatchBackend::ItemIsFile;
        event.id = static_cast<quint64>(arrived);
        missed.append(event);
    }
    std::sort(missed.begin(), missed.end(),
              [](const PendingEvent& a, const PendingEvent& b) { return a.id < b.id; });
    m_batch += missed;
    if (!m_batch.isEmpty()) {
        qDebug() << "FolderWatcher: catching up on" << m_batch.size() << "entries since cursor" << cursor;
        m_latencyTimer.stop();
        processBatch();
    }
}

bool FolderWatcher::acceptEvent(const PendingEvent& event) const
{
    if (!(event.flags & (WatchBackend::ItemCreated | WatchBackend::ItemRenamed))) return false;
    if (event.flags & (WatchBackend::ItemRemoved | WatchBackend::ItemIsDir)) return false;

    const QFileInfo fi(event.path);
    if (QDir::cleanPath(fi.absolutePath()) != m_folder) return false;
    if (utils::isIgnoredFileName(fi.fileName())) return false;
    return fi.exists() && fi.isFile();
}

void FolderWatcher::processBatch()
{
    const QVector<PendingEvent> batch = m_batch;
    m_batch.clear();
    const quint64 generation = m_generation;

    quint64 maxId = 0;
    QSet<QString> seen;
    for (const PendingEvent& event : batch) {
        maxId = qMax(maxId, event.id);
        if (!acceptEvent(event)) continue;
        const QString path = QDir::cleanPath(event.path);
        if (seen.contains(path)) continue;
        seen.insert(path);

        emit candidateDetected(path);
        if (generation != m_generation) return;   // stopped by a receiver
        if (m_autoCheck) checkReadiness(path);
    }
    advanceCursor(maxId);
}

void FolderWatcher::advanceCursor(quint64 cursor)
{
    // Event ids and file stamps never move the cursor past the clock.
    cursor = qMin(cursor, static_cast<quint64>(QDateTime::currentMSecsSinceEpoch()));
    if (!isWatching() || cursor <= m_cursor) return;
    m_cursor = cursor;
    QSettings settings;
    settings.setValue(cursorKey(m_folder), QVariant::fromValue<qulonglong>(m_cursor));
}

void FolderWatcher::onReady(const QString& path, bool forced, quint64 generation)
{
    if (generation != m_generation) return;
    m_pendingChecks.remove(path);
    // Released files must not come back through the catch-up scan.
    const qint64 arrived = arrivalStamp(QFileInfo(path));
    if (arrived > 0) advanceCursor(static_cast<quint64>(arrived));
    emit fileReady(path, forced);
}

void FolderWatcher::onDiscarded(const QString& path, const QString& reason, quint64 generation)
{
    if (generation != m_generation) return;
    m_pendingChecks.remove(path);
    qDebug() << "FolderWatcher: discarded" << path << "-" << reason;
    emit fileDiscarded(path, reason);
}

quint64 FolderWatcher::savedCursor(const QString& folder)
{
    QSettings settings;
    return settings.value(cursorKey(utils::normalizeFilePath(folder)), 0).toULongLong();
}

void FolderWatcher::resetCursor(const QString& folder)
{
    QSettings settings;
    settings.remove(cursorKey(utils::normalizeFilePath(folder)));
}
