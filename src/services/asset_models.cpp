module;
#include <algorithm>
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QList>
#include <QMap>
#include <QString>
#include <QUrl>

module skylift.services.asset_models;

QJsonObject CreateAssetRequest::toJson() const
{
    QJsonObject obj;
    obj["gallery"] = gallery;
    if (!section.isEmpty()) obj["section"] = section;
    obj["asset_name"] = assetName;
    obj["content_length"] = contentLength;
    obj["visibility"] = QStringLiteral("public");
    obj["position"] = 0;
    obj["upload_type"] = multipart ? QStringLiteral("multipart") : QStringLiteral("post");
    obj["accelerated"] = true;
    return obj;
}

bool UploadTarget::fromJson(const QByteArray& body, UploadTarget* out, QString* errorString)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorString) *errorString = parseError.error != QJsonParseError::NoError
                                            ? parseError.errorString()
                                            : QStringLiteral("response is not a JSON object");
        return false;
    }

    const QJsonObject root = doc.object();
    const QJsonValue versionValue = root.value("version_data");
    if (!versionValue.isObject()) {
        if (errorString) *errorString = QStringLiteral("missing version_data");
        return false;
    }
    const QJsonObject version = versionValue.toObject();

    UploadTarget target;
    const QJsonValue id = version.value("id");
    target.assetId = id.isString() ? id.toString() : id.toVariant().toString();
    target.status = version.value("status").toString();
    target.originalKey = version.value("original_key").toString();
    target.uploadId = version.value("upload_id").toString();

    const QString uploadUrl = version.value("upload_url").toString();
    if (!uploadUrl.isEmpty()) target.uploadUrl = QUrl(uploadUrl, QUrl::StrictMode);

    const QJsonObject fields = version.value("amz_fields").toObject();
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        const QJsonValue v = it.value();
        target.formFields.insert(it.key(), v.isString() ? v.toString() : v.toVariant().toString());
    }

    const QJsonArray urls = version.value("upload_urls").toArray();
    for (const QJsonValue& entry : urls) {
        const QString url = entry.isObject() ? entry.toObject().value("upload_url").toString()
                                             : entry.toString();
        target.partUrls.append(QUrl(url, QUrl::StrictMode));
    }

    if (out) *out = target;
    return true;
}

QJsonObject CompleteMultipartRequest::toJson() const
{
    QJsonArray partArray;
    for (const CompletedPart& part : skylift::utils::sortedParts(parts)) {
        QJsonObject p;
        p["ETag"] = part.eTag;
        p["PartNumber"] = part.partNumber;
        partArray.append(p);
    }

    QJsonObject obj;
    obj["key"] = key;
    obj["upload_id"] = uploadId;
    obj["parts"] = partArray;
    return obj;
}

QJsonObject AbortMultipartRequest::toJson() const
{
    QJsonObject obj;
    obj["key"] = key;
    obj["upload_id"] = uploadId;
    return obj;
}

namespace skylift::utils {

QList<CompletedPart> sortedParts(QList<CompletedPart> parts)
{
    std::sort(parts.begin(), parts.end(), [](const CompletedPart& a, const CompletedPart& b) {
        return a.partNumber < b.partNumber;
    });
    return parts;
}

} // namespace skylift::utils
