//
// UmlRenderCache
//
// Copyright (c) 2025 Adrian Sutherland
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QDebug>

#include <cstdio>
#include <memory>

#include "FilePresenter.h"
#include "Logger.h"
#include "RenderErrors.h"
#include "RenderInvoker.h"
#include "RenderOrchestrator.h"
#include "core/InMemoryCacheStore.h"
#include "core/PathContext.h"
#include "core/RendererSettings.h"
#include "core/SqliteCacheStore.h"
#include "logging_categories.h"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitUsage = 1,
    ExitConfiguration = 2,
    ExitLaunch = 3,
    ExitRender = 4,
    ExitCache = 5,
};

constexpr qint64 kMsecsPerDay = 24LL * 60 * 60 * 1000;

void printError(const QString& message)
{
    std::fprintf(stderr, "umlrender: %s\n", message.toLocal8Bit().constData());
    std::fflush(stderr);
}

bool readSource(const QString& path, QString& source, QString& error)
{
    QFile file;
    bool opened = false;
    if (path == QStringLiteral("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        error = QStringLiteral("Cannot read %1: %2").arg(path, file.errorString());
        return false;
    }
    source = QString::fromUtf8(file.readAll());
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication::setOrganizationName(QStringLiteral("UmlRenderCache"));
    QCoreApplication::setApplicationName(QStringLiteral("UmlRenderCache"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    // Keep the console clean unless the user opts in via QT_LOGGING_RULES or --verbose.
    if (qEnvironmentVariableIsEmpty("QT_LOGGING_RULES")) {
        QLoggingCategory::setFilterRules(QStringLiteral(
            "urc.*.debug=false\n"
            "urc.*.info=false\n"));
    }

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Render PlantUML diagrams through a local renderer with a persistent cache."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption typeOption({QStringLiteral("t"), QStringLiteral("type")},
                                        QStringLiteral("Output type: ascii, png or svg."),
                                        QStringLiteral("type"), QStringLiteral("svg"));
    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                          QStringLiteral("Output file, or - for stdout."),
                                          QStringLiteral("file"), QStringLiteral("-"));
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
                                            QStringLiteral("Renderer settings JSON file."),
                                            QStringLiteral("file"));
    const QCommandLineOption cacheOption(QStringLiteral("cache"),
                                         QStringLiteral("SQLite cache file."),
                                         QStringLiteral("file"));
    const QCommandLineOption noCacheOption(QStringLiteral("no-cache"),
                                           QStringLiteral("Use a throwaway in-memory cache."));
    const QCommandLineOption documentOption(QStringLiteral("document"),
                                            QStringLiteral("Document the diagram belongs to (sets the working directory)."),
                                            QStringLiteral("path"));
    const QCommandLineOption vaultOption(QStringLiteral("vault"),
                                         QStringLiteral("Vault root used for relative renderer paths."),
                                         QStringLiteral("dir"));
    const QCommandLineOption purgeOption(QStringLiteral("purge-days"),
                                         QStringLiteral("Remove cache entries not accessed for <days> days, then exit."),
                                         QStringLiteral("days"));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"),
                                           QStringLiteral("Log cache and process activity to stderr."));

    parser.addOptions({typeOption, outputOption, settingsOption, cacheOption, noCacheOption,
                       documentOption, vaultOption, purgeOption, verboseOption});
    parser.addPositionalArgument(QStringLiteral("diagram"), QStringLiteral("Diagram source file, or - for stdin."));
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        AppLogHelper::setGlobalDebugEnabled(true);
        QLoggingCategory::setFilterRules(QStringLiteral("urc.*=true"));
        AppLogHelper::setSink([](const QString& line, bool) {
            std::fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
        });
    }

    const QString cachePath = parser.isSet(cacheOption) ? parser.value(cacheOption)
                                                        : SqliteCacheStore::defaultDatabasePath();

    if (parser.isSet(purgeOption)) {
        bool ok = false;
        const int days = parser.value(purgeOption).toInt(&ok);
        if (!ok || days < 0) {
            printError(QStringLiteral("--purge-days expects a non-negative number"));
            return ExitUsage;
        }
        try {
            SqliteCacheStore store(cachePath);
            store.initialize();
            const qint64 cutoff = QDateTime::currentMSecsSinceEpoch() - days * kMsecsPerDay;
            const int purged = store.purgeOlderThan(cutoff);
            std::fprintf(stdout, "Purged %d cached diagrams\n", purged);
        } catch (const CacheError& e) {
            printError(e.message());
            return ExitCache;
        }
        return ExitOk;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        printError(QStringLiteral("expected exactly one diagram file (or -)"));
        parser.showHelp(ExitUsage);
    }

    const std::optional<OutputKind> kind = outputKindFromName(parser.value(typeOption));
    if (!kind) {
        printError(QStringLiteral("unknown output type '%1'").arg(parser.value(typeOption)));
        return ExitUsage;
    }

    RendererSettings settings;
    const QString settingsPath = parser.isSet(settingsOption) ? parser.value(settingsOption)
                                                              : RendererSettings::defaultSettingsPath();
    if (parser.isSet(settingsOption) || QFileInfo::exists(settingsPath)) {
        if (!settings.loadFromFile(settingsPath)) {
            printError(QStringLiteral("cannot load settings from %1").arg(settingsPath));
            return ExitUsage;
        }
    }

    QString source;
    QString readError;
    if (!readSource(positional.first(), source, readError)) {
        printError(readError);
        return ExitUsage;
    }

    std::unique_ptr<ICacheStore> cache;
    if (parser.isSet(noCacheOption)) {
        cache = std::make_unique<InMemoryCacheStore>();
    } else {
        auto sqlite = std::make_unique<SqliteCacheStore>(cachePath);
        try {
            sqlite->initialize();
        } catch (const CacheError& e) {
            printError(e.message());
            return ExitCache;
        }
        cache = std::move(sqlite);
    }

    const VaultPathContext paths(parser.value(vaultOption));
    RenderInvoker invoker(settings, paths.basePath());
    RenderOrchestrator orchestrator(*cache, invoker, paths);
    FilePresenter presenter(parser.value(outputOption));

    QFuture<RenderedDiagram> future = orchestrator.render(source, *kind, parser.value(documentOption), &presenter);

    try {
        const RenderedDiagram diagram = future.result();
        qCInfo(urc_render).noquote() << "umlrender:" << outputKindName(diagram.kind) << diagram.key
                                     << (diagram.fromCache ? "served from cache" : "rendered");
    } catch (const ConfigurationError& e) {
        printError(e.message());
        return ExitConfiguration;
    } catch (const LaunchError& e) {
        printError(e.message());
        return ExitLaunch;
    } catch (const RenderError& e) {
        printError(e.message());
        return ExitRender;
    } catch (const CacheError& e) {
        printError(e.message());
        return ExitCache;
    }

    if (presenter.hasError()) {
        printError(presenter.errorString());
        return ExitUsage;
    }

    return ExitOk;
}
