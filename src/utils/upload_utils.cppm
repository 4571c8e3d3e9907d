/*!
 * @file        upload_utils.cppm
 * @brief       Common helpers for paths, headers and human readable values.
 * @details     Small side-effect free helpers shared by the transfer core,
 *              the folder watcher and the command line front end.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QUrl>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module skylift.utils.upload_utils;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

SKYLIFT_MODULE_EXPORT namespace skylift::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and cleans the result so that the same
 * file always maps to the same string (used for queue de-duplication).
 *
 * @param path Local path or file:// URL.
 * @return Normalized absolute local path, or an empty string.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Strips surrounding double quotes from an ETag header value.
 *
 * Storage backends return ETags as "\"abc\""; the completion call expects
 * the bare value.
 */
QString unquoteETag(const QString& value);

/**
 * @brief Builds a settings key segment from an arbitrary folder path.
 *
 * Slashes and other reserved characters are percent-encoded so the whole
 * path becomes a single QSettings key.
 */
QString settingsKeyForPath(const QString& path);

/**
 * @brief Formats a byte count as "12.3 MB".
 */
QString formatBytes(qint64 bytes);

/**
 * @brief Formats a duration in seconds as "1m 05s" or "42s".
 */
QString formatDuration(double seconds);

/**
 * @brief Returns true for HTTP status codes in the 2xx range.
 */
bool isSuccessStatus(int status);

} // namespace skylift::utils
