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

#include <QHash>
#include <QMutex>
#include <QString>
#include <atomic>

#include "ICacheStore.h"

/**
 * @brief Process-local cache store keyed by CacheSlot::storageKey().
 *
 * Used for --no-cache runs and as the substitute store in tests.
 */
class InMemoryCacheStore : public ICacheStore {
public:
    InMemoryCacheStore() = default;

    QFuture<std::optional<QString>> get(const CacheSlot& slot) override;
    QFuture<void> set(const CacheSlot& slot, const QString& value) override;

    bool contains(const QString& storageKey) const;
    QString value(const QString& storageKey) const;
    QHash<QString, QString> snapshot() const;
    int size() const;
    void clear();

    // Direct write that bypasses the async path and the write counter (test setup).
    void seed(const CacheSlot& slot, const QString& value);
    void remove(const CacheSlot& slot);

    int readCount() const { return m_reads.load(); }
    int writeCount() const { return m_writes.load(); }

private:
    mutable QMutex m_mutex;
    QHash<QString, QString> m_entries;
    std::atomic<int> m_reads {0};
    std::atomic<int> m_writes {0};
};
