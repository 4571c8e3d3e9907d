module;
#include <QDebug>
#include <QFileInfo>
#include <QList>
#include <QPair>
#include <QSet>
#include <QSettings>
#include <QTimer>
#include <QtGlobal>

module skylift.core.uploadscheduler;

import skylift.utils.upload_config;
import skylift.utils.upload_errors;
import skylift.utils.upload_utils;
import skylift.services.asset_transport;
import skylift.core.concurrencycoordinator;
import skylift.core.uploadtask;
import skylift.core.uploadmodel;

namespace utils = skylift::utils;

static QString settingsGroup()
{
    return QStringLiteral("uploads");
}

UploadScheduler::UploadScheduler(AssetTransport* transport, ConcurrencyCoordinator* coordinator, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_coordinator(coordinator)
    , m_maxConcurrentSmallFiles(utils::defaultMaxConcurrentSmallFiles())
    , m_multipartThreshold(utils::defaultMultipartThreshold())
    , m_completionDisplayDelayMs(utils::defaultCompletionDisplayDelayMs())
    , m_retryBaseDelayMs(utils::defaultRetryBaseDelayMs())
{
    m_resetTimer.setSingleShot(true);
    connect(&m_resetTimer, &QTimer::timeout, this, &UploadScheduler::resetQueue);
    loadSettings();
}

QString UploadScheduler::stateString() const
{
    switch (m_state) {
    case State::Idle: return "Idle";
    case State::Uploading: return "Uploading";
    case State::Completed: return "Completed";
    case State::Failed: return "Failed";
    }
    return "Unknown";
}

int UploadScheduler::enqueue(const QStringList& paths)
{
    QSet<QString> seen;
    QList<QPair<QString, qint64>> accepted;
    for (const QString& raw : paths) {
        const QString path = utils::normalizeFilePath(raw);
        if (path.isEmpty() || seen.contains(path)) continue;
        seen.insert(path);

        if (isPending(path)) {
            qDebug() << "Already queued:" << path;
            continue;
        }
        QFileInfo info(path);
        if (!info.exists() || !info.isFile()) {
            qWarning() << "Cannot enqueue missing file" << path;
            emit fileFinished(path, false, utils::errorDescription(UploadError::FileNotFound));
            continue;
        }
        accepted.append({ path, info.size() });
    }
    if (accepted.isEmpty()) return 0;

    if (m_state == State::Completed || m_state == State::Failed) {
        // New files during the completion display start a fresh run.
        m_resetTimer.stop();
        resetQueue();
    }
    if (m_state == State::Idle) {
        m_elapsed.start();
    }

    for (const auto& entry : accepted) {
        UploadTask* task = createTask(entry.first, entry.second);
        m_queue.append(task);
        m_model.addTask(task);
        m_totalBytes += entry.second;
    }

    setState(State::Uploading);
    startQueued();
    updateTotals();
    emit countsChanged();
    return accepted.size();
}

UploadTask* UploadScheduler::createTask(const QString& path, qint64 size)
{
    const UploadTask::Strategy strategy = utils::shouldUseMultipart(size, m_multipartThreshold)
                                              ? UploadTask::Strategy::Multipart
                                              : UploadTask::Strategy::SinglePart;
    auto* task = new UploadTask(QString::number(++m_nextId), path, size, strategy,
                                m_transport, m_coordinator, this);
    task->setGalleryId(m_galleryId);
    task->setSectionId(m_sectionId);
    task->setRetryBaseDelayMs(m_retryBaseDelayMs);

    connect(task, &UploadTask::finished, this, &UploadScheduler::onTaskFinished);
    connect(task, &UploadTask::bytesTransferredChanged, this, &UploadScheduler::onTaskBytes);
    connect(task, &UploadTask::progressChanged, this, &UploadScheduler::updateTotals);
    return task;
}

bool UploadScheduler::isPending(const QString& path) const
{
    for (const UploadTask* t : m_queue) {
        if (t && !t->isFinished() && t->filePath() == path) return true;
    }
    return false;
}

void UploadScheduler::startQueued()
{
    int runningSmall = 0;
    bool multipartRunning = false;
    for (const UploadTask* t : m_queue) {
        if (!t || !t->isRunning()) continue;
        if (t->isMultipart()) {
            multipartRunning = true;
        } else {
            runningSmall++;
        }
    }

    for (UploadTask* candidate : m_queue) {
        if (!candidate || !candidate->isQueued()) continue;
        if (candidate->isMultipart()) {
            if (multipartRunning) continue;
            multipartRunning = true;
        } else {
            if (runningSmall >= m_maxConcurrentSmallFiles) continue;
            runningSmall++;
        }
        candidate->start();
        emit fileStarted(candidate->filePath());
    }
}

void UploadScheduler::onTaskFinished(bool success)
{
    UploadTask* t = qobject_cast<UploadTask*>(sender());
    if (!t) return;

    if (m_bulkCancelInProgress) {
        // `cancelAll()` handles container cleanup in one shot.
        return;
    }

    if (success) {
        m_succeeded++;
    } else {
        m_failed++;
    }
    emit fileFinished(t->filePath(), success, t->errorString());

    startQueued();
    updateTotals();
    emit countsChanged();

    if (activeCount() == 0 && queuedCount() == 0) {
        finishQueue();
    }
}

void UploadScheduler::onTaskBytes(qint64 delta)
{
    m_transferredBytes += delta;
    updateTotals();
}

void UploadScheduler::updateTotals()
{
    double weighted = 0.0;
    if (!m_queue.isEmpty()) {
        for (const UploadTask* t : m_queue) {
            if (!t) continue;
            // Failed tasks are done as far as the queue is concerned.
            const double taskProgress = t->isFinished() ? 1.0 : t->progress();
            if (m_totalBytes > 0) {
                weighted += (double)t->size() / m_totalBytes * taskProgress;
            } else {
                weighted += taskProgress / m_queue.size();
            }
        }
    }
    weighted = qBound(0.0, weighted, 1.0);
    if (weighted > 1.0 - 1e-9) weighted = 1.0;

    const double elapsedSec = m_elapsed.isValid() ? m_elapsed.elapsed() / 1000.0 : 0.0;
    const double speed = elapsedSec > 0.0 ? m_transferredBytes / elapsedSec : 0.0;
    const double eta = speed > 0.0 ? qMax<qint64>(0, m_totalBytes - m_transferredBytes) / speed : 0.0;

    const double progress = qMax(m_progress, weighted);
    if (qFuzzyCompare(progress + 1.0, m_progress + 1.0) && qFuzzyCompare(speed + 1.0, m_speed + 1.0)
        && qFuzzyCompare(eta + 1.0, m_eta + 1.0)) {
        return;
    }
    m_progress = progress;
    m_speed = speed;
    m_eta = eta;
    emit statusChanged();
}

void UploadScheduler::finishQueue()
{
    setState(m_failed > 0 ? State::Failed : State::Completed);
    qInfo() << "Upload queue finished:" << m_succeeded << "uploaded," << m_failed << "failed,"
            << utils::formatBytes(m_transferredBytes) << "in" << utils::formatDuration(m_elapsed.elapsed() / 1000.0);
    emit queueFinished(m_succeeded, m_failed);
    m_resetTimer.start(m_completionDisplayDelayMs);
}

void UploadScheduler::resetQueue()
{
    for (int i = m_queue.size() - 1; i >= 0; --i) {
        UploadTask* t = m_queue[i];
        if (!t || !t->isFinished()) continue;
        m_queue.removeAt(i);
        const int row = m_model.indexOf(t);
        if (row >= 0) {
            m_model.removeAt(row);
        } else {
            t->deleteLater();
        }
    }

    m_totalBytes = 0;
    m_transferredBytes = 0;
    for (const UploadTask* t : m_queue) m_totalBytes += t->size();
    m_progress = 0.0;
    m_speed = 0.0;
    m_eta = 0.0;
    m_succeeded = 0;
    m_failed = 0;
    m_elapsed.invalidate();

    setState(m_queue.isEmpty() ? State::Idle : State::Uploading);
    emit statusChanged();
    emit countsChanged();
}

void UploadScheduler::cancelAll()
{
    if (m_queue.isEmpty()) return;
    m_bulkCancelInProgress = true;
    for (UploadTask* t : m_queue) {
        if (t && t->isRunning()) t->cancel();
    }
    m_bulkCancelInProgress = false;

    m_resetTimer.stop();
    for (UploadTask* t : m_queue) {
        if (!t) continue;
        disconnect(t, nullptr, this, nullptr);
        const int row = m_model.indexOf(t);
        if (row >= 0) {
            m_model.removeAt(row);
        } else {
            t->deleteLater();
        }
    }
    m_queue.clear();
    resetQueue();
    emit queueCancelled();
}

int UploadScheduler::activeCount() const
{
    int count = 0;
    for (const UploadTask* t : m_queue) {
        if (t && t->isRunning()) count++;
    }
    return count;
}

int UploadScheduler::queuedCount() const
{
    int count = 0;
    for (const UploadTask* t : m_queue) {
        if (t && t->isQueued()) count++;
    }
    return count;
}

void UploadScheduler::setMaxConcurrentSmallFiles(int value)
{
    if (value < 1) value = 1;
    if (m_maxConcurrentSmallFiles == value) return;
    m_maxConcurrentSmallFiles = value;
    saveSettings();
    emit settingsChanged();
    startQueued();
}

void UploadScheduler::setMultipartThreshold(qint64 bytes)
{
    if (bytes < 0) bytes = 0;
    if (m_multipartThreshold == bytes) return;
    m_multipartThreshold = bytes;
    saveSettings();
    emit settingsChanged();
}

void UploadScheduler::setCompletionDisplayDelayMs(int ms)
{
    if (ms < 0) ms = 0;
    if (m_completionDisplayDelayMs == ms) return;
    m_completionDisplayDelayMs = ms;
    saveSettings();
    emit settingsChanged();
}

void UploadScheduler::setState(State state)
{
    if (m_state == state) return;
    m_state = state;
    emit statusChanged();
}

void UploadScheduler::loadSettings()
{
    QSettings settings;
    settings.beginGroup(settingsGroup());
    m_maxConcurrentSmallFiles = qMax(1, settings.value("maxConcurrentSmallFiles", m_maxConcurrentSmallFiles).toInt());
    m_multipartThreshold = qMax<qint64>(0, settings.value("multipartThreshold", m_multipartThreshold).toLongLong());
    m_completionDisplayDelayMs = qMax(0, settings.value("completionDisplayDelayMs", m_completionDisplayDelayMs).toInt());
    settings.endGroup();
}

void UploadScheduler::saveSettings() const
{
    QSettings settings;
    settings.beginGroup(settingsGroup());
    settings.setValue("maxConcurrentSmallFiles", m_maxConcurrentSmallFiles);
    settings.setValue("multipartThreshold", m_multipartThreshold);
    settings.setValue("completionDisplayDelayMs", m_completionDisplayDelayMs);
    settings.endGroup();
}
