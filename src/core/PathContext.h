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
 * @brief Host-supplied locations for a render request.
 */
class IPathContext {
public:
    virtual ~IPathContext() = default;

    /**
     * @brief Directory the renderer runs in for the given document, so
     *        relative !include lines in the diagram resolve next to it.
     */
    virtual QString workingDirectory(const QString& documentPath) const = 0;

    /**
     * @brief Root used to resolve a relative renderer executable path.
     */
    virtual QString basePath() const = 0;
};

/**
 * @brief Path context for documents stored under one root directory (a vault).
 */
class VaultPathContext : public IPathContext {
public:
    explicit VaultPathContext(const QString& rootPath);

    QString workingDirectory(const QString& documentPath) const override;
    QString basePath() const override { return m_root; }

private:
    QString m_root;
};
