//
// RenderInvoker tests
//
// The process tests drive the fake_renderer executable built alongside
// the unit tests (FAKE_RENDERER_PATH), so no Java or PlantUML install is needed.
//

#include <gtest/gtest.h>

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtConcurrent/QtConcurrent>

#include "RenderErrors.h"
#include "RenderInvoker.h"
#include "test_app.h"

#ifndef FAKE_RENDERER_PATH
#error "FAKE_RENDERER_PATH must point at the fake_renderer executable"
#endif

namespace {

const QString kDiagram = QStringLiteral("@startuml\nAlice -> Bob : hello\n@enduml\n");

RendererSettings fakeSettings()
{
    RendererSettings s;
    s.localExecutablePath = QStringLiteral(FAKE_RENDERER_PATH);
    return s;
}

RenderInvoker::ProcessOutcome outcome(const QByteArray& out, const QString& err, int code,
                                      QProcess::ExitStatus status = QProcess::NormalExit)
{
    RenderInvoker::ProcessOutcome o;
    o.output = out;
    o.diagnostics = err;
    o.exitCode = code;
    o.exitStatus = status;
    return o;
}

// Scoped environment variable for the child process.
class EnvGuard {
public:
    EnvGuard(const char* name, const QByteArray& value)
        : m_name(name)
    {
        qputenv(m_name, value);
    }
    ~EnvGuard() { qunsetenv(m_name); }

private:
    const char* m_name;
};

} // namespace

// ---------------------------------------------------------------------------
// Completion policy

TEST(RenderInvokerPolicyTest, CleanExitReturnsText)
{
    const QString svg = RenderInvoker::interpretArtifact(outcome("<svg/>", QString(), 0), OutputKind::Svg);
    EXPECT_EQ(svg, QStringLiteral("<svg/>"));

    const QString ascii = RenderInvoker::interpretArtifact(outcome("  +--+\n", QString(), 0), OutputKind::Ascii);
    EXPECT_EQ(ascii, QStringLiteral("  +--+\n"));
}

TEST(RenderInvokerPolicyTest, CleanExitPngIsBase64)
{
    const QByteArray bytes("\x89PNG\r\n\x1a\n\x00\xff", 10);
    const QString png = RenderInvoker::interpretArtifact(outcome(bytes, QString(), 0), OutputKind::Png);
    EXPECT_EQ(QByteArray::fromBase64(png.toLatin1()), bytes);
}

TEST(RenderInvokerPolicyTest, CleanExitWithoutOutputFails)
{
    try {
        RenderInvoker::interpretArtifact(outcome(QByteArray(), QStringLiteral("  Cannot find Graphviz\n"), 0),
                                         OutputKind::Svg);
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.message(), QStringLiteral("Cannot find Graphviz"));
    }

    try {
        RenderInvoker::interpretArtifact(outcome(QByteArray(), QString(), 0), OutputKind::Png);
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.message(), QStringLiteral("No output from PlantUML"));
    }
}

TEST(RenderInvokerPolicyTest, FailedPngWithOutputIsReturned)
{
    const QByteArray bytes("\x89PNG-error-image", 16);
    const QString png = RenderInvoker::interpretArtifact(outcome(bytes, QStringLiteral("Syntax Error?"), 200),
                                                         OutputKind::Png);
    EXPECT_EQ(QByteArray::fromBase64(png.toLatin1()), bytes);
}

TEST(RenderInvokerPolicyTest, FailedTextPrefersDiagnostics)
{
    try {
        RenderInvoker::interpretArtifact(outcome("<svg>partial</svg>", QStringLiteral("Syntax Error? (line 2)\n"), 200),
                                         OutputKind::Svg);
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.message(), QStringLiteral("Syntax Error? (line 2)"));
        EXPECT_EQ(e.exitCode(), 200);
    }
}

TEST(RenderInvokerPolicyTest, FailedTextFallsBackToOutputThenExitCode)
{
    try {
        RenderInvoker::interpretArtifact(outcome("error on stdout\n", QString(), 1), OutputKind::Ascii);
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.message(), QStringLiteral("error on stdout"));
    }

    try {
        RenderInvoker::interpretArtifact(outcome(QByteArray(), QString(), 3), OutputKind::Svg);
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.message(), QStringLiteral("PlantUML exited with code 3"));
        EXPECT_EQ(e.exitCode(), 3);
    }
}

TEST(RenderInvokerPolicyTest, CrashIsFailure)
{
    EXPECT_THROW(RenderInvoker::interpretArtifact(outcome(QByteArray(), QString(), 0, QProcess::CrashExit),
                                                  OutputKind::Svg),
                 RenderError);
}

TEST(RenderInvokerPolicyTest, MapMayBeEmpty)
{
    EXPECT_EQ(RenderInvoker::interpretMap(outcome(QByteArray(), QString(), 0)), QString());
    EXPECT_EQ(RenderInvoker::interpretMap(outcome("<map></map>", QString(), 0)), QStringLiteral("<map></map>"));
}

TEST(RenderInvokerPolicyTest, MapFailureMessage)
{
    try {
        RenderInvoker::interpretMap(outcome(QByteArray(), QString(), 2));
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.message(), QStringLiteral("PlantUML map generation exited with code 2"));
    }

    try {
        RenderInvoker::interpretMap(outcome(QByteArray(), QStringLiteral("bad map\n"), 2));
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.message(), QStringLiteral("bad map"));
    }
}

// ---------------------------------------------------------------------------
// Child process

TEST(RenderInvokerProcessTest, RendersSvgWithFormatFlags)
{
    sharedTestApp();
    RenderInvoker invoker(fakeSettings(), QDir::currentPath());

    const QString svg = invoker.renderArtifact(kDiagram, OutputKind::Svg, QString()).result();
    EXPECT_TRUE(svg.contains(QStringLiteral("<svg")));
    EXPECT_TRUE(svg.contains(QStringLiteral("Alice -&gt; Bob : hello")));
    EXPECT_TRUE(svg.contains(QStringLiteral("-Djava.awt.headless=true -charset utf-8 -tsvg -pipe")));
}

TEST(RenderInvokerProcessTest, RendersAsciiWithTxtFlag)
{
    sharedTestApp();
    RenderInvoker invoker(fakeSettings(), QDir::currentPath());

    const QString text = invoker.renderArtifact(kDiagram, OutputKind::Ascii, QString()).result();
    EXPECT_TRUE(text.startsWith(QStringLiteral("ASCII\n")));
    EXPECT_TRUE(text.endsWith(kDiagram));
}

TEST(RenderInvokerProcessTest, PngIsBinarySafe)
{
    sharedTestApp();
    RenderInvoker invoker(fakeSettings(), QDir::currentPath());

    const QString png = invoker.renderArtifact(kDiagram, OutputKind::Png, QString()).result();
    const QByteArray bytes = QByteArray::fromBase64(png.toLatin1());

    const QByteArray signature("\x89PNG\r\n\x1a\n\x00\x01\xff", 11);
    ASSERT_GE(bytes.size(), signature.size());
    EXPECT_EQ(bytes.left(signature.size()), signature);
    EXPECT_EQ(bytes.mid(signature.size()), kDiagram.toUtf8());
}

TEST(RenderInvokerProcessTest, SourceIsSentAsUtf8)
{
    sharedTestApp();
    RenderInvoker invoker(fakeSettings(), QDir::currentPath());

    const QString source = QString::fromUtf8("@startuml\nBob -> Alice : gr\xC3\xBC\xC3\x9F \xE2\x9C\x93\n@enduml\n");
    const QString text = invoker.renderArtifact(source, OutputKind::Ascii, QString()).result();
    EXPECT_TRUE(text.contains(QString::fromUtf8("gr\xC3\xBC\xC3\x9F \xE2\x9C\x93")));
}

TEST(RenderInvokerProcessTest, RendersMap)
{
    sharedTestApp();
    RenderInvoker invoker(fakeSettings(), QDir::currentPath());

    const QString map = invoker.renderMap(kDiagram, QString()).result();
    EXPECT_TRUE(map.contains(QStringLiteral("<map id=\"plantuml_map\"")));

    const QString empty = invoker.renderMap(kDiagram + QStringLiteral("'fake: no-map\n"), QString()).result();
    EXPECT_TRUE(empty.isEmpty());
}

TEST(RenderInvokerProcessTest, NonZeroExitCarriesDiagnostics)
{
    sharedTestApp();
    RenderInvoker invoker(fakeSettings(), QDir::currentPath());

    const QString source = QStringLiteral("@startuml\n'fake: stderr Syntax Error? (line 2)\n'fake: no-output\n"
                                          "'fake: exit 200\n@enduml\n");
    QFuture<QString> future = invoker.renderArtifact(source, OutputKind::Svg, QString());
    try {
        future.waitForFinished();
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.message(), QStringLiteral("Syntax Error? (line 2)"));
        EXPECT_EQ(e.exitCode(), 200);
    }
}

TEST(RenderInvokerProcessTest, SilentSuccessIsFailure)
{
    sharedTestApp();
    RenderInvoker invoker(fakeSettings(), QDir::currentPath());

    const QString source = QStringLiteral("@startuml\n'fake: no-output\n@enduml\n");
    EXPECT_THROW(invoker.renderArtifact(source, OutputKind::Svg, QString()).waitForFinished(), RenderError);
}

TEST(RenderInvokerProcessTest, PngWithErrorExitStillReturnsImage)
{
    sharedTestApp();
    RenderInvoker invoker(fakeSettings(), QDir::currentPath());

    const QString source = QStringLiteral("@startuml\n'fake: exit 200\n@enduml\n");
    const QString png = invoker.renderArtifact(source, OutputKind::Png, QString()).result();
    EXPECT_TRUE(QByteArray::fromBase64(png.toLatin1()).startsWith("\x89PNG"));
}

TEST(RenderInvokerProcessTest, MissingExecutableIsLaunchError)
{
    sharedTestApp();
    RendererSettings s;
    s.localExecutablePath = QStringLiteral("/nonexistent/urc/plantuml");
    RenderInvoker invoker(s, QDir::currentPath());

    EXPECT_THROW(invoker.renderArtifact(kDiagram, OutputKind::Svg, QString()).waitForFinished(), LaunchError);
}

TEST(RenderInvokerProcessTest, BlankExecutableIsConfigurationError)
{
    sharedTestApp();
    RendererSettings s;
    s.localExecutablePath = QStringLiteral("   ");
    RenderInvoker invoker(s, QDir::currentPath());

    EXPECT_THROW(invoker.renderArtifact(kDiagram, OutputKind::Svg, QString()).waitForFinished(),
                 ConfigurationError);
}

TEST(RenderInvokerProcessTest, RunsInRequestedWorkingDirectory)
{
    sharedTestApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    RenderInvoker invoker(fakeSettings(), QDir::currentPath());

    const QString svg = invoker.renderArtifact(kDiagram, OutputKind::Svg, dir.path()).result();
    const QString canonical = QFileInfo(dir.path()).canonicalFilePath();
    EXPECT_TRUE(svg.contains(QStringLiteral("<!-- cwd: %1 -->").arg(canonical))
                || svg.contains(QStringLiteral("<!-- cwd: %1 -->").arg(dir.path())))
        << svg.toStdString();
}

TEST(RenderInvokerProcessTest, RelativeExecutableResolvesAgainstBasePath)
{
    sharedTestApp();
    const QFileInfo fake(QStringLiteral(FAKE_RENDERER_PATH));
    RendererSettings s;
    s.localExecutablePath = fake.fileName();
    RenderInvoker invoker(s, fake.absolutePath());

    const QString svg = invoker.renderArtifact(kDiagram, OutputKind::Svg, QString()).result();
    EXPECT_TRUE(svg.contains(QStringLiteral("<svg")));
}

TEST(RenderInvokerProcessTest, ChattyRendererWithLargeInputDoesNotDeadlock)
{
    sharedTestApp();
    const EnvGuard flood("FAKE_RENDERER_FLOOD", QByteArrayLiteral("1048576"));
    RenderInvoker invoker(fakeSettings(), QDir::currentPath());

    QString source = QStringLiteral("@startuml\n");
    while (source.size() < 2 * 1024 * 1024) {
        source += QStringLiteral("Alice -> Bob : a reasonably long message line\n");
    }
    source += QStringLiteral("@enduml\n");

    QElapsedTimer timer;
    timer.start();
    const QString text = invoker.renderArtifact(source, OutputKind::Ascii, QString()).result();
    EXPECT_LT(timer.elapsed(), 60000);

    // 1 MiB of 'x' followed by the normal answer.
    EXPECT_TRUE(text.startsWith(QString(1048576, QLatin1Char('x')) + QStringLiteral("ASCII\n")));
    EXPECT_TRUE(text.endsWith(source));
}

TEST(RenderInvokerProcessTest, TimeoutKillsRenderer)
{
    sharedTestApp();
    RendererSettings s = fakeSettings();
    s.processTimeoutMs = 300;
    RenderInvoker invoker(s, QDir::currentPath());

    const QString source = QStringLiteral("@startuml\n'fake: sleep 10000\n@enduml\n");
    QElapsedTimer timer;
    timer.start();
    try {
        invoker.renderArtifact(source, OutputKind::Svg, QString()).waitForFinished();
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_TRUE(e.message().contains(QStringLiteral("timed out")));
    }
    EXPECT_LT(timer.elapsed(), 8000);
}

TEST(RenderInvokerProcessTest, SettingsChangeAppliesToNextCall)
{
    sharedTestApp();
    RendererSettings broken;
    broken.localExecutablePath = QString();
    RenderInvoker invoker(broken, QDir::currentPath());

    EXPECT_THROW(invoker.renderArtifact(kDiagram, OutputKind::Svg, QString()).waitForFinished(),
                 ConfigurationError);

    invoker.setSettings(fakeSettings());
    EXPECT_EQ(invoker.settings(), fakeSettings());
    EXPECT_TRUE(invoker.renderArtifact(kDiagram, OutputKind::Svg, QString()).result().contains(QStringLiteral("<svg")));
}
