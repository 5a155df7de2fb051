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

#include <QMutex>
#include <QString>

#include "IDiagramPresenter.h"

/**
 * @brief Builds the HTML fragment a host document inserts for a diagram.
 *
 * ASCII becomes an escaped <pre>, SVG is inlined without its XML prolog,
 * PNG becomes a data-URI <img> bound to its image map. The map is renamed
 * to the diagram key so several diagrams on one page keep separate maps.
 */
class HtmlFragmentPresenter : public IDiagramPresenter {
public:
    HtmlFragmentPresenter() = default;

    void presentAscii(const QString& text) override;
    void presentSvg(const QString& svg) override;
    void presentImageWithMap(const QString& imageBase64, const QString& mapHtml, const QString& key) override;

    QString html() const;
    bool hasContent() const;

    // Rewrites the id and name attributes of the first <map> element to @p name.
    static QString renameImageMap(const QString& mapHtml, const QString& name);

private:
    void setHtml(const QString& html);

    mutable QMutex m_mutex;
    QString m_html;
};
