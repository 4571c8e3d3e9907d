/*!
 * @file        file_filters.cppm
 * @brief       File name rules for watched folders.
 * @details     Decides which directory entries are worth uploading: hidden
 *              and AppleDouble files, partially downloaded or temporary files
 *              are ignored, and staging folders only accept image formats.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module skylift.utils.file_filters;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

SKYLIFT_MODULE_EXPORT namespace skylift::utils {

/**
 * @brief Returns true for names starting with '.' (".DS_Store", "._photo.jpg").
 */
bool isHiddenFileName(const QString& fileName);

/**
 * @brief Returns true when the name ends in a transient suffix such as ".tmp".
 */
bool hasTransientSuffix(const QString& fileName);

/**
 * @brief Suffixes written by tools while a file is still being produced.
 */
QStringList transientSuffixes();

/**
 * @brief Combined filter used by the folder watcher.
 *
 * @param fileName Bare file name, without directory.
 * @return true if the entry must never be considered for upload.
 */
bool isIgnoredFileName(const QString& fileName);

/**
 * @brief Image extensions accepted from staging folders.
 */
QStringList imageExtensions();

/**
 * @brief Checks the extension of a path against imageExtensions().
 */
bool isImageFile(const QString& filePath);

} // namespace skylift::utils
