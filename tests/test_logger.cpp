//
// AppLogHelper tests
//

#include <gtest/gtest.h>

#include <QList>
#include <QPair>
#include <QString>

#include "Logger.h"

namespace {

using Captured = QList<QPair<QString, bool>>;

class LoggerSinkTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        AppLogHelper::setSink([this](const QString& line, bool isWarn) {
            m_lines.append(qMakePair(line, isWarn));
        });
    }

    void TearDown() override
    {
        AppLogHelper::setSink(AppLogHelper::Sink());
        AppLogHelper::setGlobalDebugEnabled(false);
    }

    Captured m_lines;
};

} // namespace

TEST_F(LoggerSinkTest, LogLineReachesSink)
{
    URC_LOG << "FilePresenter: wrote " << 42 << " bytes";

    ASSERT_EQ(m_lines.size(), 1);
    EXPECT_EQ(m_lines.first().first, QStringLiteral("FilePresenter: wrote 42 bytes"));
    EXPECT_FALSE(m_lines.first().second);
}

TEST_F(LoggerSinkTest, WarningIsPrefixedAndFlagged)
{
    URC_WARN << "cache unavailable";

    ASSERT_EQ(m_lines.size(), 1);
    EXPECT_EQ(m_lines.first().first, QStringLiteral("Warning: cache unavailable"));
    EXPECT_TRUE(m_lines.first().second);
}

TEST_F(LoggerSinkTest, CategoryMacroTagsLine)
{
    URC_CLOG(render) << "hit";

    ASSERT_EQ(m_lines.size(), 1);
    EXPECT_EQ(m_lines.first().first, QStringLiteral("[render] hit"));
}

TEST(LoggerTest, GlobalDebugFlag)
{
    AppLogHelper::setGlobalDebugEnabled(true);
    EXPECT_TRUE(AppLogHelper::isGlobalDebugEnabled());
    AppLogHelper::setGlobalDebugEnabled(false);
    EXPECT_FALSE(AppLogHelper::isGlobalDebugEnabled());
}
