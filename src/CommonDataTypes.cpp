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
#include "CommonDataTypes.h"

QString CacheSlot::storageKey() const
{
    return cacheNamespacePrefix(ns) + QLatin1Char('-') + key;
}

QString outputKindName(OutputKind kind)
{
    switch (kind) {
    case OutputKind::Ascii: return QStringLiteral("ascii");
    case OutputKind::Png:   return QStringLiteral("png");
    case OutputKind::Svg:   return QStringLiteral("svg");
    }
    return QStringLiteral("unknown");
}

std::optional<OutputKind> outputKindFromName(const QString& name)
{
    const QString lower = name.trimmed().toLower();
    if (lower == QStringLiteral("ascii") || lower == QStringLiteral("txt")) {
        return OutputKind::Ascii;
    }
    if (lower == QStringLiteral("png")) {
        return OutputKind::Png;
    }
    if (lower == QStringLiteral("svg")) {
        return OutputKind::Svg;
    }
    return std::nullopt;
}

QString outputKindFormatFlag(OutputKind kind)
{
    switch (kind) {
    case OutputKind::Ascii: return QStringLiteral("txt");
    case OutputKind::Png:   return QStringLiteral("png");
    case OutputKind::Svg:   return QStringLiteral("svg");
    }
    return QStringLiteral("svg");
}

CacheNamespace artifactNamespace(OutputKind kind)
{
    switch (kind) {
    case OutputKind::Ascii: return CacheNamespace::Ascii;
    case OutputKind::Png:   return CacheNamespace::Png;
    case OutputKind::Svg:   return CacheNamespace::Svg;
    }
    return CacheNamespace::Svg;
}

QString cacheNamespacePrefix(CacheNamespace ns)
{
    // Prefixes match the key layout of caches written by earlier releases.
    switch (ns) {
    case CacheNamespace::Ascii:     return QStringLiteral("ascii");
    case CacheNamespace::Png:       return QStringLiteral("png");
    case CacheNamespace::Svg:       return QStringLiteral("svg");
    case CacheNamespace::Map:       return QStringLiteral("map");
    case CacheNamespace::Timestamp: return QStringLiteral("ts");
    }
    return QString();
}
