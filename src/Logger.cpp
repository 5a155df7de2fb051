//
// UmlRenderCache
//
// Copyright (c) 2025 Adrian Sutherland
//
#include "Logger.h"

#include <QMutex>
#include <QMutexLocker>
#include <atomic>

namespace {

QMutex& sinkMutex()
{
    static QMutex mutex;
    return mutex;
}

AppLogHelper::Sink& sinkSlot()
{
    static AppLogHelper::Sink sink;
    return sink;
}

std::atomic<bool> s_globalDebugEnabled {false};

} // namespace

AppLogHelper::AppLogHelper(bool isWarn)
    : m_isWarn(isWarn)
{
}

void AppLogHelper::setGlobalDebugEnabled(bool enabled)
{
    s_globalDebugEnabled.store(enabled);
}

bool AppLogHelper::isGlobalDebugEnabled()
{
    return s_globalDebugEnabled.load();
}

void AppLogHelper::setSink(Sink sink)
{
    QMutexLocker locker(&sinkMutex());
    sinkSlot() = std::move(sink);
}

AppLogHelper::~AppLogHelper()
{
    {
        QMutexLocker locker(&sinkMutex());
        const Sink& sink = sinkSlot();
        if (sink) {
            sink(m_isWarn ? QStringLiteral("Warning: ") + m_buffer : m_buffer, m_isWarn);
            return;
        }
    }

    // No sink installed (tests, library use).
    // Warnings always go to the console; debug lines only when enabled.
    if (m_isWarn) {
        qWarning().noquote() << m_buffer;
    } else if (isGlobalDebugEnabled()) {
        qDebug().noquote() << m_buffer;
    }
}
