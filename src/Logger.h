//
// UmlRenderCache
//
// Copyright (c) 2025 Adrian Sutherland
//
#pragma once

#include <QString>
#include <QDebug>
#include <functional>

class AppLogHelper {
public:
    using Sink = std::function<void(const QString& line, bool isWarn)>;

    AppLogHelper(bool isWarn);
    ~AppLogHelper();
    QDebug stream() { return QDebug(&m_buffer).nospace(); }

    static void setGlobalDebugEnabled(bool enabled);
    static bool isGlobalDebugEnabled();

    // Route every finished line to @p sink instead of qDebug/qWarning. Pass an empty Sink to reset.
    static void setSink(Sink sink);

private:
    QString m_buffer;
    bool m_isWarn;
};

#define URC_LOG AppLogHelper(false).stream()
#define URC_WARN AppLogHelper(true).stream()
#define URC_CLOG(category) (AppLogHelper(false).stream() << "[" #category "] ")
