module;
#include <cmath>
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <QUrl>
#include <QtGlobal>

module skylift.utils.upload_utils;

namespace skylift::utils {

QString normalizeFilePath(const QString& path)
{
    QString local = path.trimmed();
    if (local.startsWith("file://")) {
        QUrl url(local);
        if (url.isValid() && url.isLocalFile()) {
            local = url.toLocalFile();
        }
    }
    if (local.isEmpty()) return QString();
    return QDir::cleanPath(QFileInfo(local).absoluteFilePath());
}

QString unquoteETag(const QString& value)
{
    QString etag = value.trimmed();
    if (etag.startsWith("W/")) etag = etag.mid(2);
    while (etag.startsWith('"')) etag.remove(0, 1);
    while (etag.endsWith('"')) etag.chop(1);
    return etag;
}

QString settingsKeyForPath(const QString& path)
{
    const QString clean = QDir::cleanPath(path);
    return QString::fromLatin1(QUrl::toPercentEncoding(clean));
}

QString formatBytes(qint64 bytes)
{
    if (bytes < 1024) return QStringLiteral("%1 B").arg(bytes);
    const char* units[] = { "KB", "MB", "GB", "TB" };
    double value = bytes;
    int unit = -1;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    return QStringLiteral("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(units[unit]));
}

QString formatDuration(double seconds)
{
    if (seconds <= 0 || !std::isfinite(seconds)) return QStringLiteral("0s");
    const qint64 total = qRound64(seconds);
    const qint64 hours = total / 3600;
    const qint64 minutes = (total % 3600) / 60;
    const qint64 secs = total % 60;
    if (hours > 0) {
        return QStringLiteral("%1h %2m").arg(hours).arg(minutes, 2, 10, QLatin1Char('0'));
    }
    if (minutes > 0) {
        return QStringLiteral("%1m %2s").arg(minutes).arg(secs, 2, 10, QLatin1Char('0'));
    }
    return QStringLiteral("%1s").arg(secs);
}

bool isSuccessStatus(int status)
{
    return status >= 200 && status < 300;
}

} // namespace skylift::utils
