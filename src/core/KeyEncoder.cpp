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
#include "KeyEncoder.h"

namespace {

// qCompress framing: 4-byte big-endian length, 2-byte zlib header, ..., 4-byte Adler-32.
constexpr int kLengthPrefixSize = 4;
constexpr int kZlibHeaderSize = 2;
constexpr int kZlibTrailerSize = 4;

// A single final fixed-Huffman block holding only end-of-block.
const QByteArray& emptyDeflateStream()
{
    static const QByteArray stream("\x03\x00", 2);
    return stream;
}

} // namespace

QString KeyEncoder::encode(const QString& source)
{
    return encode64(deflateRaw(source.toUtf8()));
}

QByteArray KeyEncoder::deflateRaw(const QByteArray& data)
{
    const QByteArray framed = qCompress(data, 9);
    const int overhead = kLengthPrefixSize + kZlibHeaderSize + kZlibTrailerSize;

    // qCompress returns only the length prefix for empty input
    if (framed.size() <= overhead) {
        return emptyDeflateStream();
    }

    return framed.mid(kLengthPrefixSize + kZlibHeaderSize, framed.size() - overhead);
}

QString KeyEncoder::encode64(const QByteArray& data)
{
    QString result;
    result.reserve(((data.size() + 2) / 3) * 4);

    const auto byteAt = [&data](int i) -> int {
        return i < data.size() ? static_cast<unsigned char>(data.at(i)) : 0;
    };

    for (int i = 0; i < data.size(); i += 3) {
        const int b1 = byteAt(i);
        const int b2 = byteAt(i + 1);
        const int b3 = byteAt(i + 2);

        result.append(encode6bit(b1 >> 2));
        result.append(encode6bit(((b1 & 0x3) << 4) | (b2 >> 4)));
        result.append(encode6bit(((b2 & 0xF) << 2) | (b3 >> 6)));
        result.append(encode6bit(b3 & 0x3F));
    }

    return result;
}

QChar KeyEncoder::encode6bit(int value)
{
    value &= 0x3F;
    if (value < 10) {
        return QChar('0' + value);
    }
    value -= 10;
    if (value < 26) {
        return QChar('A' + value);
    }
    value -= 26;
    if (value < 26) {
        return QChar('a' + value);
    }
    value -= 26;
    return value == 0 ? QChar('-') : QChar('_');
}
