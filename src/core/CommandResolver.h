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
#pragma once

#include <QString>

#include "CommonDataTypes.h"
#include "RendererSettings.h"

/**
 * @brief Builds the renderer command line from the user's settings.
 *
 * The result carries the launcher prefix and the fixed options only:
 * @code
 * java -Djava.awt.headless=true -jar <jar> -charset utf-8 [-graphvizdot <dot>]
 * <exe> -Djava.awt.headless=true -charset utf-8 [-graphvizdot <dot>]
 * @endcode
 * Format (-t<fmt>) and streaming (-pipe / -pipemap) flags are appended by
 * the caller because they differ per invocation.
 */
class CommandResolver
{
public:
    static constexpr const char* kHeadlessFlag = "-Djava.awt.headless=true";
    static constexpr const char* kJarFlag = "-jar";
    static constexpr const char* kCharsetFlag = "-charset";
    static constexpr const char* kCharsetValue = "utf-8";
    static constexpr const char* kGraphvizFlag = "-graphvizdot";

    /**
     * @brief Resolve the full command for the current settings.
     *
     * @param settings Renderer settings snapshot
     * @param baseDir  Directory a relative executable path is resolved against
     * @param homeDir  Expansion of a leading '~' (defaults to the user's home)
     * @throws ConfigurationError if the executable path is empty, or the
     *         executable is a .jar and no Java runtime is configured.
     */
    static RendererCommand resolve(const RendererSettings& settings,
                                   const QString& baseDir,
                                   const QString& homeDir = QString());

    /**
     * @brief Expand '~', keep absolute paths, resolve relative paths against @p baseDir.
     * @return The resolved path; empty if @p configured is blank.
     */
    static QString resolveExecutablePath(const QString& configured,
                                         const QString& baseDir,
                                         const QString& homeDir = QString());

    // True when the executable must be launched through the Java runtime.
    static bool requiresRuntime(const QString& executablePath);

    // -graphvizdot is passed only for a non-blank value other than the "dot" sentinel.
    static bool shouldPassGraphvizPath(const QString& dotPath);
};
