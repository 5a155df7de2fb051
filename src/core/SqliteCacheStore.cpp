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
#include "SqliteCacheStore.h"

#include "RenderErrors.h"
#include "logging_categories.h"

#include <QDir>
#include <QFileInfo>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QStandardPaths>
#include <QUuid>
#include <QVariant>
#include <QtConcurrent/QtConcurrent>

#include <functional>

namespace {

using DatabaseBody = std::function<void(QSqlDatabase& db, QString& errorMessage)>;

// Runs @p body on a private connection and throws CacheError once the connection is gone.
void withDatabase(const QString& dbPath, const QString& purpose, const DatabaseBody& body)
{
    const QString connectionName = QStringLiteral("urc_cache_%1_%2")
                                       .arg(purpose, QUuid::createUuid().toString(QUuid::Id128));
    QString errorMessage;

    {
        QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName);
        db.setDatabaseName(dbPath);
        db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=5000"));
        if (!db.open()) {
            errorMessage = QStringLiteral("Failed to open render cache '%1': %2")
                               .arg(dbPath, db.lastError().text());
        } else {
            body(db, errorMessage);
            db.close();
        }
        // db goes out of scope here, before removeDatabase is called.
    }

    QSqlDatabase::removeDatabase(connectionName);

    if (!errorMessage.isEmpty()) {
        qCWarning(urc_cache).noquote() << "SqliteCacheStore:" << errorMessage;
        throw CacheError(errorMessage);
    }
}

} // namespace

SqliteCacheStore::SqliteCacheStore(const QString& dbPath)
    : m_dbPath(dbPath)
{
}

void SqliteCacheStore::initialize()
{
    // Every operation opens its own connection, and each ":memory:" connection is a separate empty database.
    if (m_dbPath.trimmed() == QStringLiteral(":memory:")) {
        throw CacheError(QStringLiteral("The render cache needs a database file; use --no-cache for an in-memory cache"));
    }

    const QFileInfo fi(m_dbPath);
    if (!QDir().mkpath(fi.dir().absolutePath())) {
        throw CacheError(QStringLiteral("Cannot create directory for render cache '%1'").arg(m_dbPath));
    }

    withDatabase(m_dbPath, QStringLiteral("init"), [](QSqlDatabase& db, QString& errorMessage) {
        QSqlQuery query(db);
        if (!query.exec(QString::fromUtf8(kCacheSchemaEntries))) {
            errorMessage = QStringLiteral("Failed to create cache_entries table: %1")
                               .arg(query.lastError().text());
        }
    });

    qCInfo(urc_cache).noquote() << "SqliteCacheStore: using" << m_dbPath;
}

QFuture<std::optional<QString>> SqliteCacheStore::get(const CacheSlot& slot)
{
    return QtConcurrent::run([this, slot]() -> std::optional<QString> {
        return readSlot(slot);
    });
}

QFuture<void> SqliteCacheStore::set(const CacheSlot& slot, const QString& value)
{
    return QtConcurrent::run([this, slot, value]() {
        writeSlot(slot, value);
    });
}

std::optional<QString> SqliteCacheStore::readSlot(const CacheSlot& slot) const
{
    std::optional<QString> result;

    withDatabase(m_dbPath, QStringLiteral("get"), [&slot, &result](QSqlDatabase& db, QString& errorMessage) {
        QSqlQuery query(db);
        query.prepare(QStringLiteral("SELECT value FROM cache_entries WHERE namespace = ? AND cache_key = ?"));
        query.addBindValue(cacheNamespacePrefix(slot.ns));
        query.addBindValue(slot.key);
        if (!query.exec()) {
            errorMessage = QStringLiteral("Failed to read %1: %2")
                               .arg(slot.storageKey(), query.lastError().text());
            return;
        }
        if (query.next()) {
            result = query.value(0).toString();
        }
    });

    return result;
}

void SqliteCacheStore::writeSlot(const CacheSlot& slot, const QString& value) const
{
    withDatabase(m_dbPath, QStringLiteral("set"), [&slot, &value](QSqlDatabase& db, QString& errorMessage) {
        QSqlQuery query(db);
        query.prepare(QStringLiteral("INSERT OR REPLACE INTO cache_entries (namespace, cache_key, value) VALUES (?, ?, ?)"));
        query.addBindValue(cacheNamespacePrefix(slot.ns));
        query.addBindValue(slot.key);
        query.addBindValue(value);
        if (!query.exec()) {
            errorMessage = QStringLiteral("Failed to write %1: %2")
                               .arg(slot.storageKey(), query.lastError().text());
        }
    });
}

int SqliteCacheStore::purgeOlderThan(qint64 cutoffMsecs)
{
    int purged = 0;
    const QString tsNamespace = cacheNamespacePrefix(CacheNamespace::Timestamp);

    withDatabase(m_dbPath, QStringLiteral("purge"), [&](QSqlDatabase& db, QString& errorMessage) {
        if (!db.transaction()) {
            errorMessage = QStringLiteral("Failed to begin purge transaction: %1").arg(db.lastError().text());
            return;
        }

        QSqlQuery countQuery(db);
        countQuery.prepare(QStringLiteral(
            "SELECT COUNT(*) FROM cache_entries WHERE namespace = ? AND CAST(value AS INTEGER) < ?"));
        countQuery.addBindValue(tsNamespace);
        countQuery.addBindValue(cutoffMsecs);
        if (!countQuery.exec() || !countQuery.next()) {
            errorMessage = QStringLiteral("Failed to count stale keys: %1").arg(countQuery.lastError().text());
            db.rollback();
            return;
        }
        const int staleKeys = countQuery.value(0).toInt();

        QSqlQuery deleteQuery(db);
        deleteQuery.prepare(QStringLiteral(
            "DELETE FROM cache_entries WHERE cache_key IN ("
            "SELECT cache_key FROM cache_entries WHERE namespace = ? AND CAST(value AS INTEGER) < ?)"));
        deleteQuery.addBindValue(tsNamespace);
        deleteQuery.addBindValue(cutoffMsecs);
        if (!deleteQuery.exec()) {
            errorMessage = QStringLiteral("Failed to purge stale keys: %1").arg(deleteQuery.lastError().text());
            db.rollback();
            return;
        }

        if (!db.commit()) {
            errorMessage = QStringLiteral("Failed to commit purge: %1").arg(db.lastError().text());
            return;
        }
        purged = staleKeys;
    });

    qCInfo(urc_cache) << "SqliteCacheStore: purged" << purged << "stale keys";
    return purged;
}

int SqliteCacheStore::entryCount()
{
    int count = 0;
    withDatabase(m_dbPath, QStringLiteral("count"), [&count](QSqlDatabase& db, QString& errorMessage) {
        QSqlQuery query(db);
        if (!query.exec(QStringLiteral("SELECT COUNT(*) FROM cache_entries")) || !query.next()) {
            errorMessage = QStringLiteral("Failed to count cache entries: %1").arg(query.lastError().text());
            return;
        }
        count = query.value(0).toInt();
    });
    return count;
}

QString SqliteCacheStore::defaultDatabasePath()
{
    QString baseDir = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    if (baseDir.isEmpty()) {
        baseDir = QDir::tempPath() + QStringLiteral("/UmlRenderCache");
    }
    return QDir(baseDir).filePath(QStringLiteral("render-cache.sqlite"));
}
