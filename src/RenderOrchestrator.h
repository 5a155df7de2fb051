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
#include <functional>
#include <optional>

#include "CommonDataTypes.h"
#include "ICacheStore.h"
#include "IDiagramPresenter.h"
#include "IDiagramRenderer.h"
#include "core/PathContext.h"

/**
 * @brief Serves a diagram from the cache, rendering and caching it on a miss.
 *
 * Per call:
 *  - key = KeyEncoder::encode(source)
 *  - hit:  present the cached artifact (and map), refresh the access timestamp
 *  - miss: render the artifact (then the map for PNG), store artifact, map
 *          and timestamp, then present
 *
 * Hits are unconditional: a changed renderer configuration does not
 * invalidate entries. A PNG whose map slot is missing counts as a miss and
 * is rendered again. Render and cache failures propagate to the caller
 * through the returned future; nothing is cached or presented in that case.
 *
 * The collaborators must outlive every call started on this object.
 */
class RenderOrchestrator {
public:
    using Clock = std::function<qint64()>;

    RenderOrchestrator(ICacheStore& cache, IDiagramRenderer& renderer, const IPathContext& paths);

    /**
     * @param source       Diagram source text
     * @param kind         Requested output kind
     * @param documentPath Document the diagram belongs to; selects the working directory
     * @param presenter    Display target, or nullptr to only return the result
     */
    QFuture<RenderedDiagram> render(const QString& source,
                                    OutputKind kind,
                                    const QString& documentPath = QString(),
                                    IDiagramPresenter* presenter = nullptr);

    QFuture<RenderedDiagram> renderAscii(const QString& source, const QString& documentPath = QString(),
                                         IDiagramPresenter* presenter = nullptr);
    QFuture<RenderedDiagram> renderPng(const QString& source, const QString& documentPath = QString(),
                                       IDiagramPresenter* presenter = nullptr);
    QFuture<RenderedDiagram> renderSvg(const QString& source, const QString& documentPath = QString(),
                                       IDiagramPresenter* presenter = nullptr);

    // Milliseconds since the epoch used for access timestamps (tests substitute a fake clock).
    void setClock(Clock clock);

private:
    RenderedDiagram run(const QString& source, OutputKind kind, const QString& documentPath,
                        IDiagramPresenter* presenter);
    std::optional<RenderedDiagram> lookup(const QString& key, OutputKind kind);
    void touchTimestamp(const QString& key);
    static void present(IDiagramPresenter* presenter, const RenderedDiagram& diagram);

    ICacheStore& m_cache;
    IDiagramRenderer& m_renderer;
    const IPathContext& m_paths;
    Clock m_clock;
};
