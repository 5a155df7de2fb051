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

/**
 * @brief Inserts a rendered diagram into one display target.
 *
 * Called from a worker thread; implementations that touch GUI objects
 * must marshal to their own thread.
 */
class IDiagramPresenter {
public:
    virtual ~IDiagramPresenter() = default;

    virtual void presentAscii(const QString& text) = 0;
    virtual void presentSvg(const QString& svg) = 0;

    /**
     * @param imageBase64 PNG bytes, base64 encoded
     * @param mapHtml     Image map markup from the renderer (may be empty)
     * @param key         Diagram key, unique per source; used to name the map
     */
    virtual void presentImageWithMap(const QString& imageBase64, const QString& mapHtml, const QString& key) = 0;
};
