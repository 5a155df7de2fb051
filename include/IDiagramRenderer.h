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

#include <QFuture>
#include <QString>

#include "CommonDataTypes.h"

/**
 * @brief Turns diagram source into rendered output.
 *
 * Failures are delivered through the future as RenderFailure subclasses
 * and rethrown by QFuture::result().
 */
class IDiagramRenderer {
public:
    virtual ~IDiagramRenderer() = default;

    /**
     * @brief Render @p source as @p kind, running in @p workingDir.
     * @return UTF-8 text for ASCII/SVG, base64 for PNG.
     */
    virtual QFuture<QString> renderArtifact(const QString& source, OutputKind kind, const QString& workingDir) = 0;

    /**
     * @brief Produce the clickable image map for @p source. May be empty.
     */
    virtual QFuture<QString> renderMap(const QString& source, const QString& workingDir) = 0;
};
