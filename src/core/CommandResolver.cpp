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
#include "CommandResolver.h"

#include "RenderErrors.h"
#include "logging_categories.h"
#include "string_utils.h"

#include <QDir>
#include <QStringList>

RendererCommand CommandResolver::resolve(const RendererSettings& settings,
                                         const QString& baseDir,
                                         const QString& homeDir)
{
    const QString executable = resolveExecutablePath(settings.localExecutablePath, baseDir, homeDir);
    if (executable.isEmpty()) {
        throw ConfigurationError(QStringLiteral("Invalid local renderer path: the executable setting is empty"));
    }

    QStringList rendererArgs {
        QString::fromLatin1(kCharsetFlag),
        QString::fromLatin1(kCharsetValue)
    };

    // Graphviz is auto-detected on the search path unless the user points elsewhere.
    const QString dotPath = urc::strings::normalize_setting_path(settings.graphvizDotPath);
    if (shouldPassGraphvizPath(dotPath)) {
        rendererArgs << QString::fromLatin1(kGraphvizFlag) << dotPath;
    }

    RendererCommand command;
    if (requiresRuntime(executable)) {
        const QString runtime = urc::strings::normalize_setting_path(settings.javaPath);
        if (runtime.isEmpty()) {
            throw ConfigurationError(QStringLiteral("Java runtime path is empty; it is required to run %1").arg(executable));
        }
        // JVM options are rejected after -jar, so the headless flag goes first.
        command.program = runtime;
        command.arguments << QString::fromLatin1(kHeadlessFlag)
                          << QString::fromLatin1(kJarFlag)
                          << executable
                          << rendererArgs;
    } else {
        command.program = executable;
        command.arguments << QString::fromLatin1(kHeadlessFlag) << rendererArgs;
    }

    qCDebug(urc_command).noquote() << "CommandResolver: program =" << command.program
                                   << "args =" << command.arguments.join(QLatin1Char(' '));
    return command;
}

QString CommandResolver::resolveExecutablePath(const QString& configured,
                                               const QString& baseDir,
                                               const QString& homeDir)
{
    const QString path = urc::strings::normalize_setting_path(configured);
    if (path.isEmpty()) {
        return QString();
    }

    if (path.startsWith(QLatin1Char('~'))) {
        const QString home = homeDir.isEmpty() ? QDir::homePath() : homeDir;
        return home + path.mid(1);
    }

    if (QDir::isAbsolutePath(path)) {
        return path;
    }

    // Relative paths are looked up from the vault, so a vault can ship its own renderer.
    return QDir::cleanPath(QDir(baseDir).absoluteFilePath(path));
}

bool CommandResolver::requiresRuntime(const QString& executablePath)
{
    return executablePath.endsWith(QStringLiteral(".jar"), Qt::CaseInsensitive);
}

bool CommandResolver::shouldPassGraphvizPath(const QString& dotPath)
{
    if (urc::strings::is_blank(dotPath)) {
        return false;
    }
    return dotPath != QString::fromLatin1(RendererSettings::kDefaultDotPath);
}
