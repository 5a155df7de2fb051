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
#include "RendererSettings.h"

#include "logging_categories.h"
#include "string_utils.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonValue>
#include <QSaveFile>
#include <QStandardPaths>
#include <QDebug>

namespace {

constexpr const char* kKeyLocalJar = "localJar";
constexpr const char* kKeyDotPath = "dotPath";
constexpr const char* kKeyJavaPath = "javaPath";
constexpr const char* kKeyTimeout = "timeoutMs";

void applyPathValue(const QJsonObject& obj, const char* key, QString& target)
{
    const QString name = QString::fromLatin1(key);
    if (!obj.contains(name)) {
        return;
    }
    const QJsonValue value = obj.value(name);
    if (!value.isString()) {
        qWarning() << "RendererSettings: ignoring non-string value for" << name;
        return;
    }
    target = urc::strings::normalize_setting_path(value.toString());
}

} // namespace

void RendererSettings::applyJson(const QJsonObject& obj)
{
    applyPathValue(obj, kKeyLocalJar, localExecutablePath);
    applyPathValue(obj, kKeyDotPath, graphvizDotPath);
    applyPathValue(obj, kKeyJavaPath, javaPath);

    const QString timeoutKey = QString::fromLatin1(kKeyTimeout);
    if (obj.contains(timeoutKey)) {
        const QJsonValue value = obj.value(timeoutKey);
        if (value.isDouble()) {
            processTimeoutMs = value.toInt(-1);
        } else {
            qWarning() << "RendererSettings: ignoring non-numeric value for" << timeoutKey;
        }
    }
}

QJsonObject RendererSettings::toJson() const
{
    QJsonObject obj;
    obj.insert(QString::fromLatin1(kKeyLocalJar), localExecutablePath);
    obj.insert(QString::fromLatin1(kKeyDotPath), graphvizDotPath);
    obj.insert(QString::fromLatin1(kKeyJavaPath), javaPath);
    obj.insert(QString::fromLatin1(kKeyTimeout), processTimeoutMs);
    return obj;
}

bool RendererSettings::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "RendererSettings: unable to open file" << path << "-" << file.errorString();
        return false;
    }

    const QByteArray payload = file.readAll();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "RendererSettings: failed to parse JSON" << parseError.errorString();
        return false;
    }

    if (!doc.isObject()) {
        qWarning() << "RendererSettings: root JSON is not an object";
        return false;
    }

    applyJson(doc.object());
    qCInfo(urc_config).noquote() << QStringLiteral("RendererSettings: loaded %1 (executable='%2', dot='%3', java='%4')")
                                        .arg(path, localExecutablePath, graphvizDotPath, javaPath);
    return true;
}

bool RendererSettings::saveToFile(const QString& path) const
{
    const QFileInfo fi(path);
    if (!QDir().mkpath(fi.dir().absolutePath())) {
        qWarning() << "RendererSettings: cannot create directory for" << path;
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "RendererSettings: unable to write" << path << "-" << file.errorString();
        return false;
    }

    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "RendererSettings: failed to commit" << path << "-" << file.errorString();
        return false;
    }
    return true;
}

QString RendererSettings::defaultSettingsPath()
{
    const QString baseDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return QDir(baseDir).filePath(QStringLiteral("UmlRenderCache/settings.json"));
}

bool RendererSettings::operator==(const RendererSettings& other) const
{
    return localExecutablePath == other.localExecutablePath
        && graphvizDotPath == other.graphvizDotPath
        && javaPath == other.javaPath
        && processTimeoutMs == other.processTimeoutMs;
}
