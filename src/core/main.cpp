#include <QCoreApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>
#include <QStringList>
#include <QUrl>

import skylift.utils.upload_config;
import skylift.utils.upload_utils;
import skylift.services.asset_transport;
import skylift.core.concurrencycoordinator;
import skylift.core.folderwatcher;
import skylift.core.uploadscheduler;
import skylift.core.ingestioncoordinator;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace utils = skylift::utils;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Skylift"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Upload images to a gallery, once or from a watched folder."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("files"), QStringLiteral("Files to upload."), QStringLiteral("[files...]"));

    const QCommandLineOption galleryOption(QStringLiteral("gallery"), QStringLiteral("Destination gallery id."), QStringLiteral("id"));
    const QCommandLineOption sectionOption(QStringLiteral("section"), QStringLiteral("Destination section id."), QStringLiteral("id"));
    const QCommandLineOption tokenOption(QStringLiteral("token"), QStringLiteral("API bearer token."), QStringLiteral("token"));
    const QCommandLineOption tenantOption(QStringLiteral("tenant"), QStringLiteral("Tenant id."), QStringLiteral("id"));
    const QCommandLineOption apiOption(QStringLiteral("api"), QStringLiteral("API base URL or environment name."), QStringLiteral("url"));
    const QCommandLineOption watchOption(QStringLiteral("watch"), QStringLiteral("Watch a live folder and upload new files."), QStringLiteral("folder"));
    const QCommandLineOption stagingOption(QStringLiteral("staging"), QStringLiteral("Watch a staging folder; uploaded files are deleted."), QStringLiteral("folder"));
    const QCommandLineOption fromNowOption(QStringLiteral("from-now"), QStringLiteral("Ignore files already in the watched folder."));
    const QCommandLineOption resetCursorOption(QStringLiteral("reset-cursor"), QStringLiteral("Forget the saved position of a watched folder."), QStringLiteral("folder"));
    parser.addOptions({ galleryOption, sectionOption, tokenOption, tenantOption, apiOption,
                        watchOption, stagingOption, fromNowOption, resetCursorOption });
    parser.process(app);

    if (parser.isSet(resetCursorOption)) {
        FolderWatcher::resetCursor(parser.value(resetCursorOption));
        qInfo() << "Cursor reset for" << parser.value(resetCursorOption);
        if (parser.positionalArguments().isEmpty() && !parser.isSet(watchOption) && !parser.isSet(stagingOption))
            return 0;
    }

    const QStringList files = parser.positionalArguments();
    const bool watching = parser.isSet(watchOption) || parser.isSet(stagingOption);
    if (files.isEmpty() && !watching) {
        parser.showHelp(1);
    }
    if (!parser.isSet(galleryOption)) {
        qWarning().noquote() << "A gallery is required (--gallery).";
        return 1;
    }

    NetworkAssetTransport transport;
    if (parser.isSet(apiOption)) {
        const QString api = parser.value(apiOption);
        if (api.startsWith(QLatin1String("http"), Qt::CaseInsensitive)) {
            transport.setBaseUrl(QUrl(api));
        } else {
            transport.setEnvironment(api);
        }
    }
    if (parser.isSet(tokenOption)) transport.setAccessToken(parser.value(tokenOption));
    if (parser.isSet(tenantOption)) transport.setTenantId(parser.value(tenantOption));

    ConcurrencyCoordinator coordinator(utils::defaultMaxConcurrentChunks());
    UploadScheduler scheduler(&transport, &coordinator);
    scheduler.setGalleryId(parser.value(galleryOption));
    scheduler.setSectionId(parser.value(sectionOption));

    IngestionCoordinator ingestion(&scheduler);

    int failures = 0;
    QObject::connect(&scheduler, &UploadScheduler::fileFinished, &app,
                     [&failures](const QString& path, bool success, const QString& errorString) {
        if (success) {
            qInfo().noquote() << "Uploaded" << path;
        } else {
            ++failures;
            qWarning().noquote() << "Failed" << path << "-" << errorString;
        }
    });
    QObject::connect(&scheduler, &UploadScheduler::queueFinished, &app,
                     [&scheduler, watching, &failures](int succeeded, int failed) {
        qInfo().noquote() << QStringLiteral("Queue finished: %1 uploaded, %2 failed, %3 at %4/s")
                                 .arg(succeeded)
                                 .arg(failed)
                                 .arg(utils::formatBytes(scheduler.totalBytes()),
                                      utils::formatBytes(static_cast<qint64>(scheduler.speed())));
        if (!watching) QCoreApplication::exit(failures == 0 ? 0 : 1);
    });
    QObject::connect(&ingestion, &IngestionCoordinator::noticeRequested, &app, [](const QString& message) {
        qWarning().noquote() << message;
    });

    if (watching) {
        const bool staging = parser.isSet(stagingOption);
        const QString folder = staging ? parser.value(stagingOption) : parser.value(watchOption);
        if (staging) {
            QString error;
            if (!IngestionCoordinator::prepareStagingFolder(folder, &error)) {
                qWarning().noquote() << error;
            }
        }
        const IngestionCoordinator::FolderPolicy policy = staging ? IngestionCoordinator::FolderPolicy::Staging
                                                                  : IngestionCoordinator::FolderPolicy::Live;
        if (!ingestion.selectWatchFolder(folder, policy, parser.isSet(fromNowOption)))
            return 1;
    }

    if (!files.isEmpty()) {
        const int created = scheduler.enqueue(files);
        if (created == 0 && !watching) {
            // Nothing could be queued, fileFinished() already reported why.
            return failures == 0 ? 0 : 1;
        }
    }

    return app.exec();
}
