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

#include <QJsonObject>
#include <QString>

/**
 * @brief User configuration for the local renderer.
 *
 * Persisted as a flat JSON object:
 * @code
 * { "localJar": "~/tools/plantuml.jar", "dotPath": "dot", "javaPath": "java", "timeoutMs": -1 }
 * @endcode
 */
struct RendererSettings {
    static constexpr const char* kDefaultExecutable = "plantuml.jar";
    static constexpr const char* kDefaultDotPath = "dot";   ///< Graphviz auto-detection sentinel
    static constexpr const char* kDefaultJavaPath = "java";

    QString localExecutablePath {QString::fromLatin1(kDefaultExecutable)};
    QString graphvizDotPath {QString::fromLatin1(kDefaultDotPath)};
    QString javaPath {QString::fromLatin1(kDefaultJavaPath)};
    int processTimeoutMs {-1}; ///< <= 0 waits for the renderer without limit

    /**
     * @brief Apply the keys present in @p obj on top of the current values.
     *
     * Keys with the wrong JSON type are skipped with a warning. String values
     * are normalized (trimmed, one pair of outer quotes removed).
     */
    void applyJson(const QJsonObject& obj);
    QJsonObject toJson() const;

    /**
     * @brief Load settings from a JSON file.
     * @return false if the file cannot be read or is not a JSON object; the
     *         current values are left untouched in that case.
     */
    bool loadFromFile(const QString& path);

    /**
     * @brief Write the settings atomically to @p path, creating parent directories.
     */
    bool saveToFile(const QString& path) const;

    // <GenericConfigLocation>/UmlRenderCache/settings.json
    static QString defaultSettingsPath();

    bool operator==(const RendererSettings& other) const;
    bool operator!=(const RendererSettings& other) const { return !(*this == other); }
};
