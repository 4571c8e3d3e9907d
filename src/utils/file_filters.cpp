module;
#include <QString>
#include <QStringList>

module skylift.utils.file_filters;

namespace skylift::utils {

bool isHiddenFileName(const QString& fileName)
{
    return fileName.startsWith('.');
}

QStringList transientSuffixes()
{
    return { ".tmp", ".part", ".crdownload", ".download" };
}

bool hasTransientSuffix(const QString& fileName)
{
    const QString lower = fileName.toLower();
    for (const QString& suffix : transientSuffixes()) {
        if (lower.endsWith(suffix)) return true;
    }
    return false;
}

bool isIgnoredFileName(const QString& fileName)
{
    if (fileName.isEmpty()) return true;
    if (isHiddenFileName(fileName)) return true;
    if (fileName == QStringLiteral("Thumbs.db")) return true;
    return hasTransientSuffix(fileName);
}

QStringList imageExtensions()
{
    return { "jpg", "jpeg", "png", "tif", "tiff", "heic", "dng", "cr2", "nef", "arw" };
}

bool isImageFile(const QString& filePath)
{
    const QString lower = filePath.toLower();
    const int slash = lower.lastIndexOf('/');
    const int dot = lower.lastIndexOf('.');
    if (dot < 0 || dot < slash) return false;
    return imageExtensions().contains(lower.mid(dot + 1));
}

} // namespace skylift::utils
