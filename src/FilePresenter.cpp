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
#include "FilePresenter.h"

#include "Logger.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>

FilePresenter::FilePresenter(const QString& outputPath)
    : m_outputPath(outputPath)
{
}

void FilePresenter::presentAscii(const QString& text)
{
    writeBytes(m_outputPath, text.toUtf8());
}

void FilePresenter::presentSvg(const QString& svg)
{
    writeBytes(m_outputPath, svg.toUtf8());
}

void FilePresenter::presentImageWithMap(const QString& imageBase64, const QString& mapHtml, const QString& key)
{
    const auto decoded = QByteArray::fromBase64Encoding(imageBase64.toLatin1(),
                                                        QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        recordError(QStringLiteral("Cached PNG for %1 is not valid base64").arg(key));
        return;
    }
    writeBytes(m_outputPath, *decoded);

    if (m_outputPath != QStringLiteral("-") && !mapHtml.trimmed().isEmpty()) {
        writeBytes(mapPath(), mapHtml.toUtf8());
    }
}

bool FilePresenter::hasError() const
{
    QMutexLocker locker(&m_mutex);
    return !m_error.isEmpty();
}

QString FilePresenter::errorString() const
{
    QMutexLocker locker(&m_mutex);
    return m_error;
}

void FilePresenter::writeBytes(const QString& path, const QByteArray& bytes)
{
    if (path == QStringLiteral("-")) {
        QFile out;
        if (!out.open(stdout, QIODevice::WriteOnly)) {
            recordError(QStringLiteral("Cannot open stdout: %1").arg(out.errorString()));
            return;
        }
        if (out.write(bytes) != bytes.size()) {
            recordError(QStringLiteral("Short write to stdout: %1").arg(out.errorString()));
        }
        out.flush();
        return;
    }

    const QFileInfo fi(path);
    if (!QDir().mkpath(fi.dir().absolutePath())) {
        recordError(QStringLiteral("Cannot create directory for %1").arg(path));
        return;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        recordError(QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
        return;
    }
    file.write(bytes);
    if (!file.commit()) {
        recordError(QStringLiteral("Failed to save %1: %2").arg(path, file.errorString()));
        return;
    }
    URC_LOG << "FilePresenter: wrote " << bytes.size() << " bytes to " << path;
}

void FilePresenter::recordError(const QString& message)
{
    URC_WARN << "FilePresenter: " << message;
    QMutexLocker locker(&m_mutex);
    if (m_error.isEmpty()) {
        m_error = message;
    }
}
