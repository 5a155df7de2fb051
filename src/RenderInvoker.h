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
#include <QProcess>
#include <QString>
#include <QStringList>

#include "IDiagramRenderer.h"
#include "core/RendererSettings.h"

/**
 * @brief Runs the external renderer as a child process.
 *
 * Each call resolves the command from the current settings, starts the
 * process in the requested working directory, writes the diagram source
 * to stdin as UTF-8 and closes it, and drains stdout (binary-safe) and
 * stderr until the process exits. Both channels are serviced while stdin
 * is still being written, so a renderer that talks before it has read all
 * input cannot deadlock the call.
 */
class RenderInvoker : public IDiagramRenderer {
public:
    static constexpr const char* kPipeFlag = "-pipe";
    static constexpr const char* kPipeMapFlag = "-pipemap";

    /**
     * @brief Everything observed from one finished renderer process.
     */
    struct ProcessOutcome {
        QByteArray output;          ///< stdout bytes in arrival order
        QString diagnostics;        ///< stderr decoded as UTF-8
        int exitCode {0};
        QProcess::ExitStatus exitStatus {QProcess::NormalExit};

        bool exitedCleanly() const { return exitStatus == QProcess::NormalExit && exitCode == 0; }
    };

    /**
     * @param settings Initial renderer settings
     * @param basePath Root a relative executable path is resolved against
     */
    RenderInvoker(const RendererSettings& settings, const QString& basePath);

    QFuture<QString> renderArtifact(const QString& source, OutputKind kind, const QString& workingDir) override;
    QFuture<QString> renderMap(const QString& source, const QString& workingDir) override;

    // Settings may change between calls; each call uses the snapshot taken when it starts.
    void setSettings(const RendererSettings& settings);
    RendererSettings settings() const;

    /**
     * @brief Start @p program with @p arguments, feed @p stdinBytes, collect until exit.
     *
     * @param timeoutMs <= 0 waits without limit; otherwise the child is
     *        killed on expiry and RenderError is thrown.
     * @throws LaunchError if the process cannot be started.
     */
    static ProcessOutcome runProcess(const QString& program,
                                     const QStringList& arguments,
                                     const QByteArray& stdinBytes,
                                     const QString& workingDir,
                                     int timeoutMs = -1);

    /**
     * @brief Apply the artifact completion policy to a finished process.
     *
     * - clean exit, output       -> decoded output (base64 for PNG)
     * - clean exit, no output    -> RenderError
     * - failed exit, output, PNG -> base64 output (the renderer draws some errors as images)
     * - any other failed exit    -> RenderError with stderr, else stdout, else the exit code
     */
    static QString interpretArtifact(const ProcessOutcome& outcome, OutputKind kind);

    /**
     * @brief Map completion policy: a clean exit succeeds even with empty output.
     */
    static QString interpretMap(const ProcessOutcome& outcome);

private:
    QString runArtifact(const QString& source, OutputKind kind, const QString& workingDir) const;
    QString runMap(const QString& source, const QString& workingDir) const;

    mutable QMutex m_mutex;
    RendererSettings m_settings;
    QString m_basePath;
};
