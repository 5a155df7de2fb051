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

#include <QFuture>
#include <QString>
#include <optional>

#include "CommonDataTypes.h"

/**
 * @file ICacheStore.h
 * @brief Asynchronous key/value persistence used by the render cache.
 */

class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    // Resolves to std::nullopt when nothing is stored under @p slot.
    virtual QFuture<std::optional<QString>> get(const CacheSlot& slot) = 0;

    // Stores @p value under @p slot, replacing any previous value. A reader
    // never observes a partially written value.
    virtual QFuture<void> set(const CacheSlot& slot, const QString& value) = 0;
};
