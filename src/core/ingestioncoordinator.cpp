module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QStringList>
#include <QTimer>
#include <QtGlobal>

module skylift.core.ingestioncoordinator;

import skylift.utils.file_filters;
import skylift.utils.upload_errors;
import skylift.utils.upload_utils;
import skylift.core.folderwatcher;
import skylift.core.uploadscheduler;

namespace utils = skylift::utils;

static QString settingsGroup()
{
    return QStringLiteral("ingestion");
}

static QString waitingText()
{
    return QStringLiteral("Waiting for new files...");
}

IngestionCoordinator::IngestionCoordinator(UploadScheduler* scheduler, QObject* parent)
    : QObject(parent)
    , m_scheduler(scheduler)
{
    // Readiness is requested explicitly so duplicate names never start a second check.
    m_watcher.setAutoCheckReadiness(false);

    connect(&m_watcher, &FolderWatcher::candidateDetected, this, &IngestionCoordinator::onCandidate);
    connect(&m_watcher, &FolderWatcher::fileReady, this, &IngestionCoordinator::onFileReady);
    connect(&m_watcher, &FolderWatcher::fileDiscarded, this, &IngestionCoordinator::onFileDiscarded);
    connect(&m_watcher, &FolderWatcher::errorOccurred, this, &IngestionCoordinator::noticeRequested);

    if (m_scheduler) {
        connect(m_scheduler, &UploadScheduler::fileFinished, this, &IngestionCoordinator::onUploadFinished);
        connect(m_scheduler, &UploadScheduler::queueCancelled, this, &IngestionCoordinator::onQueueCancelled);
    }

    m_statusText = waitingText();
    loadSettings();
}

IngestionCoordinator::~IngestionCoordinator()
{
    disconnect(&m_watcher, nullptr, this, nullptr);
    m_watcher.stop();
}

bool IngestionCoordinator::selectWatchFolder(const QString& path, FolderPolicy policy, bool startFromNow)
{
    stopWatching();

    m_policy = policy;
    if (!m_watcher.start(path, startFromNow)) {
        qWarning() << "Ingestion: cannot watch" << path;
        emit noticeRequested(QStringLiteral("Cannot watch folder %1").arg(path));
        return false;
    }

    qInfo() << "Ingestion: watching" << m_watcher.folder()
            << (m_policy == FolderPolicy::Staging ? "(staging)" : "(live)");
    setStatusText(waitingText());
    emit watchingChanged();
    return true;
}

void IngestionCoordinator::stopWatching()
{
    const bool wasWatching = m_watcher.isWatching();
    m_watcher.stop();
    resetSession();
    setStatusText(waitingText());
    emit countsChanged();
    if (wasWatching) emit watchingChanged();
}

void IngestionCoordinator::resetSession()
{
    ++m_session;
    m_uploadedFiles.clear();
    m_releasedFiles.clear();
    m_processingFiles.clear();
    m_failedFiles.clear();
    m_attempts.clear();
    m_submitted.clear();
}

bool IngestionCoordinator::ingest(const QString& path)
{
    if (!m_watcher.isWatching()) return false;
    const QString filePath = utils::normalizeFilePath(path);
    if (!accepts(filePath)) return false;
    const QString fileName = QFileInfo(filePath).fileName();
    if (m_processingFiles.contains(fileName)) return false;
    onCandidate(filePath);
    return m_processingFiles.contains(fileName);
}

bool IngestionCoordinator::accepts(const QString& path) const
{
    const QFileInfo fi(path);
    if (!fi.exists() || fi.isDir()) return false;
    if (utils::isIgnoredFileName(fi.fileName())) return false;
    if (m_policy == FolderPolicy::Staging && !utils::isImageFile(fi.fileName())) return false;
    return true;
}

void IngestionCoordinator::onCandidate(const QString& path)
{
    const QString fileName = QFileInfo(path).fileName();

    if (m_policy == FolderPolicy::Staging && !utils::isImageFile(fileName)) {
        qDebug() << "Ingestion: skipping non-image" << fileName;
        return;
    }
    if (m_uploadedFiles.contains(fileName) || m_releasedFiles.contains(fileName)
        || m_failedFiles.contains(fileName)) {
        qDebug() << "Ingestion: already handled" << fileName;
        return;
    }
    if (m_processingFiles.contains(fileName)) {
        qDebug() << "Ingestion: already processing" << fileName;
        return;
    }

    m_processingFiles.insert(fileName);
    if (!m_watcher.checkReadiness(path)) {
        m_processingFiles.remove(fileName);
        return;
    }
    setStatusText(QStringLiteral("Checking %1...").arg(fileName));
    emit countsChanged();
}

void IngestionCoordinator::onFileReady(const QString& path, bool forced)
{
    const QString fileName = QFileInfo(path).fileName();
    if (!m_processingFiles.contains(fileName) || m_releasedFiles.contains(fileName)) return;

    if (forced) qInfo() << "Ingestion: releasing" << fileName << "after the readiness budget ran out";
    m_releasedFiles.insert(fileName);
    submit(path);
}

void IngestionCoordinator::onFileDiscarded(const QString& path, const QString& reason)
{
    const QString fileName = QFileInfo(path).fileName();
    if (!m_processingFiles.contains(fileName)) return;

    if (reason == QLatin1String("unreadable")) {
        // Still locked by its producer; counts as a failed attempt.
        retryOrFail(path, utils::errorDescription(UploadError::FileReadError), true);
        return;
    }

    qDebug() << "Ingestion: discarded" << fileName << reason;
    finishFile(fileName);
    setStatusText(waitingText());
}

void IngestionCoordinator::submit(const QString& path)
{
    if (!m_scheduler) {
        markFailed(path, QStringLiteral("No upload queue"));
        return;
    }

    const QString fileName = QFileInfo(path).fileName();
    m_submitted.insert(path, fileName);
    setStatusText(QStringLiteral("Uploading %1...").arg(fileName));

    // A missing file is reported synchronously through fileFinished().
    m_scheduler->enqueue(QStringList{ path });
}

void IngestionCoordinator::onUploadFinished(const QString& path, bool success, const QString& errorString)
{
    if (!m_submitted.contains(path)) return;
    const QString fileName = m_submitted.take(path);

    if (success) {
        qInfo() << "Ingestion: uploaded" << fileName;
        m_uploadedFiles.insert(fileName);
        m_attempts.remove(fileName);
        finishFile(fileName);
        setStatusText(QStringLiteral("Uploaded %1").arg(fileName));
        emit fileIngested(path);

        if (m_policy == FolderPolicy::Staging) {
            QFile file(path);
            if (file.exists() && !file.remove()) {
                qWarning() << "Ingestion: could not delete staged file" << path << file.errorString();
            }
        }
        return;
    }

    retryOrFail(path, errorString, false);
}

void IngestionCoordinator::retryOrFail(const QString& path, const QString& errorString, bool recheck)
{
    const QString fileName = QFileInfo(path).fileName();
    const int attempts = m_attempts.value(fileName, 0) + 1;
    m_attempts.insert(fileName, attempts);
    if (attempts >= m_maxRetries) {
        markFailed(path, errorString);
        return;
    }

    qWarning() << "Ingestion: retry" << attempts << "/" << m_maxRetries << "for" << fileName << "-" << errorString;
    setStatusText(QStringLiteral("Retrying %1... (%2/%3)").arg(fileName).arg(attempts).arg(m_maxRetries));

    const quint64 session = m_session;
    QTimer::singleShot(m_retryDelayMs, this, [this, path, fileName, session, recheck]() {
        if (session != m_session || !m_processingFiles.contains(fileName)) return;
        if (!QFileInfo::exists(path)) {
            markFailed(path, utils::errorDescription(UploadError::FileNotFound));
            return;
        }
        if (!recheck) {
            submit(path);
            return;
        }
        if (m_releasedFiles.contains(fileName)) return;
        if (!m_watcher.checkReadiness(path) && !m_watcher.isCheckPending(path)) {
            markFailed(path, utils::errorDescription(UploadError::FileReadError));
            return;
        }
        setStatusText(QStringLiteral("Checking %1...").arg(fileName));
    });
}

void IngestionCoordinator::markFailed(const QString& path, const QString& errorString)
{
    const QString fileName = QFileInfo(path).fileName();
    qWarning() << "Ingestion: giving up on" << fileName << "-" << errorString;

    m_failedFiles.insert(fileName);
    m_attempts.remove(fileName);
    finishFile(fileName);
    setStatusText(QStringLiteral("Failed to upload %1").arg(fileName));

    emit fileFailed(path, errorString);
    emit noticeRequested(QStringLiteral("Failed to upload %1 from the watched folder after %2 attempts. The file will be skipped.")
                             .arg(fileName)
                             .arg(m_maxRetries));
}

void IngestionCoordinator::onQueueCancelled()
{
    if (m_submitted.isEmpty()) return;
    // Cancelled uploads are not retried; their names stay released for the session.
    for (auto it = m_submitted.cbegin(); it != m_submitted.cend(); ++it) {
        m_processingFiles.remove(it.value());
    }
    m_submitted.clear();
    setStatusText(waitingText());
    emit countsChanged();
}

void IngestionCoordinator::finishFile(const QString& fileName)
{
    m_processingFiles.remove(fileName);
    emit countsChanged();
}

void IngestionCoordinator::setStatusText(const QString& text)
{
    if (m_statusText == text) return;
    m_statusText = text;
    emit statusTextChanged();
}

void IngestionCoordinator::setMaxRetries(int value)
{
    m_maxRetries = qMax(1, value);
    saveSettings();
}

void IngestionCoordinator::setRetryDelayMs(int ms)
{
    m_retryDelayMs = qMax(0, ms);
    saveSettings();
}

bool IngestionCoordinator::prepareStagingFolder(const QString& path, QString* error)
{
    const QString folder = utils::normalizeFilePath(path);
    QDir dir(folder);
    if (folder.isEmpty() || !dir.mkpath(QStringLiteral("."))) {
        if (error) *error = QStringLiteral("Cannot create staging folder %1").arg(path);
        return false;
    }

    bool ok = true;
    const QFileInfoList leftovers = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot);
    for (const QFileInfo& fi : leftovers) {
        QFile file(fi.absoluteFilePath());
        if (!file.remove()) {
            qWarning() << "Ingestion: cannot clear" << fi.absoluteFilePath() << file.errorString();
            if (error) *error = QStringLiteral("Cannot remove %1: %2").arg(fi.fileName(), file.errorString());
            ok = false;
        }
    }
    return ok;
}

void IngestionCoordinator::loadSettings()
{
    QSettings settings;
    settings.beginGroup(settingsGroup());
    m_maxRetries = qMax(1, settings.value("maxRetries", m_maxRetries).toInt());
    m_retryDelayMs = qMax(0, settings.value("retryDelayMs", m_retryDelayMs).toInt());
    settings.endGroup();
}

void IngestionCoordinator::saveSettings() const
{
    QSettings settings;
    settings.beginGroup(settingsGroup());
    settings.setValue("maxRetries", m_maxRetries);
    settings.setValue("retryDelayMs", m_retryDelayMs);
    settings.endGroup();
}
