#include <QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#ifndef Q_MOC_RUN
import skylift.services.asset_models;
#endif

class TestAssetModels : public QObject
{
    Q_OBJECT

private slots:
    void createRequestBody()
    {
        CreateAssetRequest request;
        request.gallery = "gal_1";
        request.assetName = "photo.jpg";
        request.contentLength = 5 * 1024 * 1024;

        QJsonObject json = request.toJson();
        QCOMPARE(json.value("gallery").toString(), QString("gal_1"));
        QCOMPARE(json.value("asset_name").toString(), QString("photo.jpg"));
        QCOMPARE(json.value("content_length").toInteger(), qint64(5 * 1024 * 1024));
        QCOMPARE(json.value("visibility").toString(), QString("public"));
        QCOMPARE(json.value("position").toInt(), 0);
        QCOMPARE(json.value("upload_type").toString(), QString("post"));
        QCOMPARE(json.value("accelerated").toBool(), true);
        QVERIFY(!json.contains("section"));

        request.section = "sec_2";
        request.multipart = true;
        json = request.toJson();
        QCOMPARE(json.value("section").toString(), QString("sec_2"));
        QCOMPARE(json.value("upload_type").toString(), QString("multipart"));
    }

    void parsesSinglePartTarget()
    {
        const QByteArray body = R"({"version_data":{"id":42,"status":"pending","original_key":"o/k.jpg",
            "upload_url":"https://bucket.test/","amz_fields":{"key":"o/k.jpg","x-amz-date":"20260101"}}})";

        UploadTarget target;
        QString error;
        QVERIFY2(UploadTarget::fromJson(body, &target, &error), qPrintable(error));
        QCOMPARE(target.assetId, QString("42"));
        QCOMPARE(target.originalKey, QString("o/k.jpg"));
        QCOMPARE(target.uploadUrl, QUrl("https://bucket.test/"));
        QCOMPARE(target.formFields.size(), 2);
        QCOMPARE(target.formFields.value("x-amz-date"), QString("20260101"));
        QVERIFY(!target.isMultipart());
    }

    void parsesMultipartTarget()
    {
        const QByteArray body = R"({"version_data":{"id":"a1","original_key":"o/big.tif","upload_id":"u-9",
            "upload_urls":[{"upload_url":"https://s.test/p?n=1"},{"upload_url":"https://s.test/p?n=2"}]}})";

        UploadTarget target;
        QVERIFY(UploadTarget::fromJson(body, &target));
        QVERIFY(target.isMultipart());
        QCOMPARE(target.partUrls.size(), 2);
        QCOMPARE(target.partUrls.at(1), QUrl("https://s.test/p?n=2"));
        QCOMPARE(target.uploadId, QString("u-9"));
    }

    void rejectsMalformedResponses()
    {
        UploadTarget target;
        QString error;
        QVERIFY(!UploadTarget::fromJson("not json", &target, &error));
        QVERIFY(!error.isEmpty());
        QVERIFY(!UploadTarget::fromJson("[]", &target, &error));
        QVERIFY(!UploadTarget::fromJson(R"({"id":"x"})", &target, &error));
        QCOMPARE(error, QString("missing version_data"));
    }

    void completionSortsParts()
    {
        CompleteMultipartRequest request;
        request.key = "o/big.tif";
        request.uploadId = "u-9";
        request.parts = { { 3, "c" }, { 1, "a" }, { 2, "b" } };

        const QJsonObject json = request.toJson();
        QCOMPARE(json.value("key").toString(), QString("o/big.tif"));
        QCOMPARE(json.value("upload_id").toString(), QString("u-9"));
        const QJsonArray parts = json.value("parts").toArray();
        QCOMPARE(parts.size(), 3);
        for (int i = 0; i < parts.size(); ++i) {
            QCOMPARE(parts.at(i).toObject().value("PartNumber").toInt(), i + 1);
        }
        QCOMPARE(parts.at(0).toObject().value("ETag").toString(), QString("a"));
    }

    void abortBody()
    {
        AbortMultipartRequest request{ "o/big.tif", "u-9" };
        const QJsonObject json = request.toJson();
        QCOMPARE(json.value("key").toString(), QString("o/big.tif"));
        QCOMPARE(json.value("upload_id").toString(), QString("u-9"));
    }
};

QTEST_MAIN(TestAssetModels)
#include "tst_assetmodels.moc"
