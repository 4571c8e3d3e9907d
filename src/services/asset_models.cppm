/*!
 * @file        asset_models.cppm
 * @brief       Request and response shapes of the asset upload API.
 * @details     Plain value types for the calls made by the transfer core:
 *              asset creation, multipart completion and multipart abort.
 *              Each type knows how to convert itself to or from the JSON
 *              the service speaks (snake_case keys, version_data envelope).
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QString>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module skylift.services.asset_models;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief Body of POST /v1/assets.
 *
 * Serialized with the fixed extras visibility "public", position 0 and
 * accelerated true.
 */
SKYLIFT_MODULE_EXPORT struct CreateAssetRequest {

    //!< @brief Destination gallery id.
    QString gallery;

    //!< @brief Optional section id inside the gallery.
    QString section;

    //!< @brief File name shown for the asset.
    QString assetName;

    //!< @brief File size in bytes.
    qint64 contentLength = 0;

    //!< @brief Request presigned part URLs instead of a form POST target.
    bool multipart = false;

    QJsonObject toJson() const;
};

/**
 * @brief Parsed version_data of the asset creation response.
 *
 * A response is multipart when it carries part URLs; otherwise uploadUrl and
 * formFields describe a single form POST.
 */
SKYLIFT_MODULE_EXPORT struct UploadTarget {

    QString assetId;                    //!< version_data.id
    QString status;                     //!< version_data.status
    QString originalKey;                //!< Object key, used by multipart completion
    QUrl uploadUrl;                     //!< Form POST target (single part)
    QMap<QString, QString> formFields;  //!< Presigned form fields, key ordered
    QList<QUrl> partUrls;               //!< One presigned PUT URL per part
    QString uploadId;                   //!< Multipart upload id

    bool isMultipart() const { return !partUrls.isEmpty(); }

    /**
     * @brief Parse an asset creation response body.
     *
     * @param body Raw JSON response.
     * @param out Receives the parsed target.
     * @param errorString Receives a parse error description on failure.
     * @return true if the body was a JSON object with a version_data object.
     */
    static bool fromJson(const QByteArray& body, UploadTarget* out, QString* errorString = nullptr);
};

/**
 * @brief One finished part of a multipart upload.
 */
SKYLIFT_MODULE_EXPORT struct CompletedPart {
    int partNumber = 0;     //!< 1-based part number
    QString eTag;           //!< Unquoted ETag
};

/**
 * @brief Body of POST /v1/multipart_uploads/complete.
 *
 * toJson() always emits parts sorted by part number.
 */
SKYLIFT_MODULE_EXPORT struct CompleteMultipartRequest {
    QString key;
    QString uploadId;
    QList<CompletedPart> parts;

    QJsonObject toJson() const;
};

/**
 * @brief Body of POST /v1/multipart_uploads/abort.
 */
SKYLIFT_MODULE_EXPORT struct AbortMultipartRequest {
    QString key;
    QString uploadId;

    QJsonObject toJson() const;
};

SKYLIFT_MODULE_EXPORT namespace skylift::utils {

/**
 * @brief Returns parts ordered by ascending part number.
 */
QList<CompletedPart> sortedParts(QList<CompletedPart> parts);

} // namespace skylift::utils
