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

#include <QByteArray>
#include <QMutex>
#include <QString>

#include "IDiagramPresenter.h"

/**
 * @brief Writes a rendered diagram to a file (or stdout for "-").
 *
 * PNG artifacts are decoded from base64 before writing; a non-empty image
 * map goes next to the image as "<output>.map.html".
 */
class FilePresenter : public IDiagramPresenter {
public:
    explicit FilePresenter(const QString& outputPath);

    void presentAscii(const QString& text) override;
    void presentSvg(const QString& svg) override;
    void presentImageWithMap(const QString& imageBase64, const QString& mapHtml, const QString& key) override;

    bool hasError() const;
    QString errorString() const;
    QString outputPath() const { return m_outputPath; }
    QString mapPath() const { return m_outputPath + QStringLiteral(".map.html"); }

private:
    void writeBytes(const QString& path, const QByteArray& bytes);
    void recordError(const QString& message);

    QString m_outputPath;
    mutable QMutex m_mutex;
    QString m_error;
};
