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
#include "InMemoryCacheStore.h"

#include <QMutexLocker>
#include <QtConcurrent/QtConcurrent>

QFuture<std::optional<QString>> InMemoryCacheStore::get(const CacheSlot& slot)
{
    const QString storageKey = slot.storageKey();
    return QtConcurrent::run([this, storageKey]() -> std::optional<QString> {
        QMutexLocker locker(&m_mutex);
        ++m_reads;
        auto it = m_entries.constFind(storageKey);
        if (it == m_entries.constEnd()) {
            return std::nullopt;
        }
        return it.value();
    });
}

QFuture<void> InMemoryCacheStore::set(const CacheSlot& slot, const QString& value)
{
    const QString storageKey = slot.storageKey();
    return QtConcurrent::run([this, storageKey, value]() {
        QMutexLocker locker(&m_mutex);
        ++m_writes;
        m_entries.insert(storageKey, value);
    });
}

bool InMemoryCacheStore::contains(const QString& storageKey) const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.contains(storageKey);
}

QString InMemoryCacheStore::value(const QString& storageKey) const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.value(storageKey);
}

QHash<QString, QString> InMemoryCacheStore::snapshot() const
{
    QMutexLocker locker(&m_mutex);
    return m_entries;
}

int InMemoryCacheStore::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_entries.size());
}

void InMemoryCacheStore::clear()
{
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
}

void InMemoryCacheStore::seed(const CacheSlot& slot, const QString& value)
{
    QMutexLocker locker(&m_mutex);
    m_entries.insert(slot.storageKey(), value);
}

void InMemoryCacheStore::remove(const CacheSlot& slot)
{
    QMutexLocker locker(&m_mutex);
    m_entries.remove(slot.storageKey());
}
