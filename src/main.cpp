/**
 * @file main.cpp
 * @brief ChunkDM command-line entry point
 *
 * Parses options, loads the engine configuration, restores stored downloads
 * and runs until no download is pending or active.
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>
#include <QTimer>

#include <memory>

#include "chunkdm/engine/DownloadManager.h"
#include "chunkdm/engine/EngineConfig.h"

namespace {

void printStatus(QTextStream& out, const ChunkDM::DownloadStatusInfo& info)
{
    out << info.id.toString(QUuid::WithoutBraces) << "  "
        << ChunkDM::downloadStatusToString(info.state).leftJustified(12) << " "
        << ChunkDM::formatProgress(info).rightJustified(7) << "  "
        << ChunkDM::formatByteSize(info.bytesTransferred);
    if (info.totalBytes >= 0) {
        out << " / " << ChunkDM::formatByteSize(info.totalBytes);
    }
    out << "  " << info.url;
    if (!info.errorMessage.isEmpty()) {
        out << "  [" << info.errorMessage << "]";
    }
    out << Qt::endl;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Application metadata
    app.setOrganizationName(QStringLiteral("ChunkDM"));
    app.setApplicationName(QStringLiteral("chunkdm"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Segmented, resumable downloader"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("urls"), QStringLiteral("URLs to download."),
                                 QStringLiteral("[urls...]"));

    const QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Read settings from INI <file>."), QStringLiteral("file"));
    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output-dir")},
        QStringLiteral("Store downloads in <dir>."), QStringLiteral("dir"));
    const QCommandLineOption stateOption({QStringLiteral("s"), QStringLiteral("state-dir")},
        QStringLiteral("Keep download state in <dir>."), QStringLiteral("dir"));
    const QCommandLineOption concurrentOption({QStringLiteral("j"), QStringLiteral("max-concurrent")},
        QStringLiteral("Run at most <n> downloads at once."), QStringLiteral("n"));
    const QCommandLineOption listOption({QStringLiteral("l"), QStringLiteral("list")},
        QStringLiteral("List stored downloads and exit."));
    const QCommandLineOption resumeOption(QStringLiteral("resume-all"),
        QStringLiteral("Resume every paused download."));
    const QCommandLineOption recoverOption(QStringLiteral("recover"),
        QStringLiteral("Adopt orphaned partial files in the output directory."));
    const QCommandLineOption writeConfigOption(QStringLiteral("write-config"),
        QStringLiteral("Write the effective settings to the config file and exit."));
    const QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Enable debug logging."));

    parser.addOptions({configOption, outputOption, stateOption, concurrentOption, listOption,
                       resumeOption, recoverOption, writeConfigOption, verboseOption});
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("chunkdm.*.debug=true"));
    }

    QTextStream out(stdout);
    QTextStream err(stderr);

    // Configuration: INI file first, command line on top
    ChunkDM::EngineConfig config;
    std::unique_ptr<QSettings> settings;
    if (parser.isSet(configOption)) {
        settings = std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat);
        if (settings->status() != QSettings::NoError) {
            err << "Cannot read config file " << parser.value(configOption) << Qt::endl;
            return 1;
        }
        config = ChunkDM::EngineConfig::load(*settings);
    }
    if (parser.isSet(outputOption)) {
        config.downloadsRoot = parser.value(outputOption);
    }
    if (parser.isSet(stateOption)) {
        config.stateRoot = parser.value(stateOption);
    }
    if (parser.isSet(concurrentOption)) {
        bool ok = false;
        const int n = parser.value(concurrentOption).toInt(&ok);
        if (!ok || n < 1) {
            err << "--max-concurrent needs a positive integer" << Qt::endl;
            return 1;
        }
        config.maxConcurrent = n;
    }

    if (parser.isSet(writeConfigOption)) {
        if (!settings) {
            err << "--write-config needs --config <file>" << Qt::endl;
            return 1;
        }
        config.save(*settings);
        out << "Wrote " << QFileInfo(settings->fileName()).absoluteFilePath() << Qt::endl;
        return 0;
    }

    ChunkDM::DownloadManager manager(config);
    ChunkDM::DownloadError error;
    if (!manager.initialize(&error)) {
        err << "Failed to initialize: " << error.message << Qt::endl;
        return 1;
    }

    if (parser.isSet(recoverOption)) {
        manager.recover();
    } else {
        manager.restore();
    }

    if (parser.isSet(listOption)) {
        for (const auto& info : manager.statusAll()) {
            printStatus(out, info);
        }
        return 0;
    }

    if (parser.isSet(resumeOption)) {
        for (const auto& info : manager.statusAll()) {
            if (info.state == ChunkDM::DownloadStatus::Paused) {
                manager.resume(info.id);
            }
        }
    }

    int rejected = 0;
    for (const QString& url : parser.positionalArguments()) {
        ChunkDM::DownloadError submitError;
        const ChunkDM::TaskId id = manager.submit(url, true, &submitError);
        if (id.isNull()) {
            err << "Rejected " << url << ": " << submitError.message << Qt::endl;
            ++rejected;
        }
    }

    // Finish reports arrive on worker threads; print and check for idleness on the main thread
    QObject::connect(&manager, &ChunkDM::DownloadManager::downloadFinished, &app,
                     [&app, &out, &manager](const ChunkDM::TaskId& id, ChunkDM::DownloadStatus) {
        QMetaObject::invokeMethod(&app, [&app, &out, &manager, id]() {
            if (auto info = manager.status(id)) {
                printStatus(out, *info);
            }
            if (manager.isIdle()) {
                app.quit();
            }
        }, Qt::QueuedConnection);
    }, Qt::DirectConnection);

    QTimer progressTimer;
    QObject::connect(&progressTimer, &QTimer::timeout, &app, [&out, &manager]() {
        for (const auto& info : manager.statusAll()) {
            if (info.state == ChunkDM::DownloadStatus::Downloading) {
                printStatus(out, info);
            }
        }
    });
    progressTimer.start(1000);

    QMetaObject::invokeMethod(&app, [&app, &manager]() {
        if (manager.isIdle()) {
            app.quit();
        }
    }, Qt::QueuedConnection);

    const int result = app.exec();

    bool failed = rejected > 0;
    for (const auto& info : manager.statusAll()) {
        if (info.state == ChunkDM::DownloadStatus::Error) {
            failed = true;
        }
    }

    // Cleanup
    manager.shutdown();

    return result != 0 ? result : (failed ? 1 : 0);
}
