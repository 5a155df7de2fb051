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

#include "ICacheStore.h"

/**
 * @brief SQL schema for the persistent render cache.
 *
 * One row per (namespace, key) slot:
 *  - namespace: TEXT - cache namespace prefix ("svg", "png", "ascii", "map", "ts")
 *  - cache_key: TEXT - encoded diagram key
 *  - value:     TEXT - artifact text, base64 PNG, image map, or epoch milliseconds
 */
constexpr const char* kCacheSchemaEntries = R"(
CREATE TABLE IF NOT EXISTS cache_entries (
    namespace TEXT NOT NULL,
    cache_key TEXT NOT NULL,
    value TEXT NOT NULL,
    PRIMARY KEY (namespace, cache_key)
)
)";

/**
 * @brief Cache store backed by a SQLite file through the QSQLITE driver.
 *
 * QSqlDatabase connections are bound to the thread that opened them, so
 * every operation opens its own uniquely named connection on the worker
 * thread and removes it before returning.
 */
class SqliteCacheStore : public ICacheStore {
public:
    explicit SqliteCacheStore(const QString& dbPath);

    /**
     * @brief Create the parent directory and the schema if missing.
     * @throws CacheError if the database cannot be opened or created.
     */
    void initialize();

    QFuture<std::optional<QString>> get(const CacheSlot& slot) override;
    QFuture<void> set(const CacheSlot& slot, const QString& value) override;

    /**
     * @brief Remove every slot of each key last accessed before @p cutoffMsecs.
     *
     * Keys without a timestamp are left alone. Runs synchronously in one
     * transaction.
     * @return Number of keys purged.
     * @throws CacheError on database failure.
     */
    int purgeOlderThan(qint64 cutoffMsecs);

    // Total number of stored slots.
    int entryCount();

    const QString& databasePath() const { return m_dbPath; }

    // <CacheLocation>/render-cache.sqlite
    static QString defaultDatabasePath();

private:
    std::optional<QString> readSlot(const CacheSlot& slot) const;
    void writeSlot(const CacheSlot& slot, const QString& value) const;

    QString m_dbPath;
};
