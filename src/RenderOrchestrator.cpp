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
#include "RenderOrchestrator.h"

#include "core/KeyEncoder.h"
#include "logging_categories.h"

#include <QDateTime>
#include <QtConcurrent/QtConcurrent>

RenderOrchestrator::RenderOrchestrator(ICacheStore& cache, IDiagramRenderer& renderer, const IPathContext& paths)
    : m_cache(cache)
    , m_renderer(renderer)
    , m_paths(paths)
    , m_clock([]() { return QDateTime::currentMSecsSinceEpoch(); })
{
}

void RenderOrchestrator::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

QFuture<RenderedDiagram> RenderOrchestrator::render(const QString& source,
                                                    OutputKind kind,
                                                    const QString& documentPath,
                                                    IDiagramPresenter* presenter)
{
    return QtConcurrent::run([this, source, kind, documentPath, presenter]() -> RenderedDiagram {
        return run(source, kind, documentPath, presenter);
    });
}

QFuture<RenderedDiagram> RenderOrchestrator::renderAscii(const QString& source, const QString& documentPath,
                                                         IDiagramPresenter* presenter)
{
    return render(source, OutputKind::Ascii, documentPath, presenter);
}

QFuture<RenderedDiagram> RenderOrchestrator::renderPng(const QString& source, const QString& documentPath,
                                                       IDiagramPresenter* presenter)
{
    return render(source, OutputKind::Png, documentPath, presenter);
}

QFuture<RenderedDiagram> RenderOrchestrator::renderSvg(const QString& source, const QString& documentPath,
                                                       IDiagramPresenter* presenter)
{
    return render(source, OutputKind::Svg, documentPath, presenter);
}

RenderedDiagram RenderOrchestrator::run(const QString& source, OutputKind kind, const QString& documentPath,
                                        IDiagramPresenter* presenter)
{
    const QString key = KeyEncoder::encode(source);

    if (auto cached = lookup(key, kind)) {
        qCDebug(urc_render).noquote() << "RenderOrchestrator: cache hit" << outputKindName(kind) << key;
        present(presenter, *cached);
        touchTimestamp(key);
        return *cached;
    }

    qCDebug(urc_render).noquote() << "RenderOrchestrator: cache miss" << outputKindName(kind) << key;

    RenderedDiagram diagram;
    diagram.kind = kind;
    diagram.key = key;

    // Artifact first, then the map, both from the same working directory.
    const QString workingDir = m_paths.workingDirectory(documentPath);
    diagram.artifact = m_renderer.renderArtifact(source, kind, workingDir).result();
    if (kind == OutputKind::Png) {
        diagram.map = m_renderer.renderMap(source, workingDir).result();
    }

    // The map is written after its image: an image without a map reads as a miss.
    m_cache.set(CacheSlot {artifactNamespace(kind), key}, diagram.artifact).waitForFinished();
    if (diagram.map) {
        m_cache.set(CacheSlot {CacheNamespace::Map, key}, *diagram.map).waitForFinished();
    }
    touchTimestamp(key);

    present(presenter, diagram);
    return diagram;
}

std::optional<RenderedDiagram> RenderOrchestrator::lookup(const QString& key, OutputKind kind)
{
    const std::optional<QString> artifact = m_cache.get(CacheSlot {artifactNamespace(kind), key}).result();
    if (!artifact) {
        return std::nullopt;
    }

    RenderedDiagram diagram;
    diagram.kind = kind;
    diagram.key = key;
    diagram.artifact = *artifact;
    diagram.fromCache = true;

    if (kind == OutputKind::Png) {
        diagram.map = m_cache.get(CacheSlot {CacheNamespace::Map, key}).result();
        if (!diagram.map) {
            qCWarning(urc_render).noquote() << "RenderOrchestrator: cached PNG" << key
                                            << "has no image map; rendering again";
            return std::nullopt;
        }
    }

    return diagram;
}

void RenderOrchestrator::touchTimestamp(const QString& key)
{
    const CacheSlot slot {CacheNamespace::Timestamp, key};
    qint64 stamp = m_clock();

    // Never move the access time backwards, even if the wall clock does.
    if (const std::optional<QString> previous = m_cache.get(slot).result()) {
        bool ok = false;
        const qint64 previousStamp = previous->toLongLong(&ok);
        if (ok && previousStamp > stamp) {
            stamp = previousStamp;
        }
    }

    m_cache.set(slot, QString::number(stamp)).waitForFinished();
}

void RenderOrchestrator::present(IDiagramPresenter* presenter, const RenderedDiagram& diagram)
{
    if (!presenter) {
        return;
    }

    switch (diagram.kind) {
    case OutputKind::Ascii:
        presenter->presentAscii(diagram.artifact);
        break;
    case OutputKind::Svg:
        presenter->presentSvg(diagram.artifact);
        break;
    case OutputKind::Png:
        presenter->presentImageWithMap(diagram.artifact, diagram.map.value_or(QString()), diagram.key);
        break;
    }
}
