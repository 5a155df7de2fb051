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

#include <QByteArray>
#include <QString>

/**
 * @brief Maps diagram source text to a compact, URL-safe cache key.
 *
 * The key is the PlantUML text encoding: UTF-8 bytes, raw DEFLATE at
 * level 9, then a base64 variant over the alphabet [0-9A-Za-z-_].
 * Output depends only on the input text, so keys written by one process
 * stay valid for every later one.
 */
class KeyEncoder
{
public:
    /**
     * @brief Encode @p source into its cache key.
     *
     * Never fails; the empty string encodes to the key of an empty
     * DEFLATE stream ("0m00").
     */
    static QString encode(const QString& source);

    /**
     * @brief Raw DEFLATE (no zlib header or checksum) of @p data at level 9.
     */
    static QByteArray deflateRaw(const QByteArray& data);

    /**
     * @brief PlantUML 6-bit text encoding of @p data.
     *
     * Every 3-byte group becomes 4 characters; a short final group is
     * zero-padded, so the result length is always a multiple of 4.
     */
    static QString encode64(const QByteArray& data);

private:
    static QChar encode6bit(int value);
};
