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
#include <QStringList>
#include <optional>

enum class OutputKind { Ascii, Png, Svg };

// Logical sub-namespaces of the cache. One diagram key addresses one slot in each.
enum class CacheNamespace { Ascii, Png, Svg, Map, Timestamp };

/**
 * @brief Tagged cache address: a namespace plus the encoded diagram key.
 *
 * storageKey() flattens the pair to "<prefix>-<key>" for stores that only
 * understand plain string keys.
 */
struct CacheSlot {
    CacheNamespace ns {CacheNamespace::Svg};
    QString key;

    QString storageKey() const;
    bool operator==(const CacheSlot& other) const { return ns == other.ns && key == other.key; }
    bool operator!=(const CacheSlot& other) const { return !(*this == other); }
};

/**
 * @brief Fully resolved external renderer invocation (program + arguments).
 *
 * Produced by CommandResolver; the caller appends the per-invocation
 * format and streaming flags.
 */
struct RendererCommand {
    QString program;
    QStringList arguments;
};

/**
 * @brief Result of one orchestrated render call.
 */
struct RenderedDiagram {
    OutputKind kind {OutputKind::Svg};
    QString key;                ///< Encoded diagram key
    QString artifact;           ///< UTF-8 text (ASCII/SVG) or base64 (PNG)
    std::optional<QString> map; ///< Image map, PNG only
    bool fromCache {false};
};

QString outputKindName(OutputKind kind);
std::optional<OutputKind> outputKindFromName(const QString& name);

// Renderer format selector ("png", "svg", "txt") used for the -t flag.
QString outputKindFormatFlag(OutputKind kind);

CacheNamespace artifactNamespace(OutputKind kind);
QString cacheNamespacePrefix(CacheNamespace ns);
