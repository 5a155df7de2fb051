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
#include <QException>
#include <QString>

/**
 * @file RenderErrors.h
 * @brief Failures raised by the render pipeline.
 *
 * All types derive from QException so a failure thrown inside
 * QtConcurrent::run is rethrown with its dynamic type by QFuture::result().
 */

class RenderFailure : public QException {
public:
    explicit RenderFailure(QString message);

    const QString& message() const { return m_message; }
    const char* what() const noexcept override { return m_what.constData(); }

    void raise() const override { throw *this; }
    RenderFailure* clone() const override { return new RenderFailure(*this); }

private:
    QString m_message;
    QByteArray m_what;
};

// Renderer executable could not be resolved from the settings.
class ConfigurationError : public RenderFailure {
public:
    using RenderFailure::RenderFailure;

    void raise() const override { throw *this; }
    ConfigurationError* clone() const override { return new ConfigurationError(*this); }
};

// The renderer process could not be started.
class LaunchError : public RenderFailure {
public:
    using RenderFailure::RenderFailure;

    void raise() const override { throw *this; }
    LaunchError* clone() const override { return new LaunchError(*this); }
};

/**
 * @brief The renderer ran but produced no usable output or exited non-zero.
 */
class RenderError : public RenderFailure {
public:
    explicit RenderError(QString message, int exitCode = 0, QString diagnostics = QString());

    int exitCode() const { return m_exitCode; }
    const QString& diagnostics() const { return m_diagnostics; }

    void raise() const override { throw *this; }
    RenderError* clone() const override { return new RenderError(*this); }

private:
    int m_exitCode {0};
    QString m_diagnostics;
};

// Persistent cache store could not be read or written.
class CacheError : public RenderFailure {
public:
    using RenderFailure::RenderFailure;

    void raise() const override { throw *this; }
    CacheError* clone() const override { return new CacheError(*this); }
};
