//
// KeyEncoder tests
//

#include <gtest/gtest.h>

#include <QRegularExpression>
#include <QSet>
#include <QString>

#include "CommonDataTypes.h"
#include "core/KeyEncoder.h"

namespace {

bool isKeySafe(const QString& key)
{
    static const QRegularExpression allowed(QStringLiteral("^[0-9A-Za-z_-]*$"));
    return allowed.match(key).hasMatch();
}

const QString kSequence = QStringLiteral("@startuml\nA->B\n@enduml");

} // namespace

TEST(KeyEncoderTest, SameSourceSameKey)
{
    const QString first = KeyEncoder::encode(kSequence);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(KeyEncoder::encode(kSequence), first);
    }
    EXPECT_EQ(KeyEncoder::encode(QString(kSequence)), first);
}

TEST(KeyEncoderTest, EmptySourceHasKey)
{
    EXPECT_EQ(KeyEncoder::encode(QString()), QStringLiteral("0m00"));
    EXPECT_EQ(KeyEncoder::encode(QStringLiteral("")), QStringLiteral("0m00"));
}

TEST(KeyEncoderTest, KeyUsesStorageSafeAlphabet)
{
    const QStringList sources = {
        kSequence,
        QStringLiteral("@startuml\nclass Foo<T> {\n  +bar(): Map<String, List<Int>>\n}\n@enduml"),
        QString::fromUtf8("@startuml\nBob -> Alice : h\xC3\xA9llo \xE2\x9C\x93 \xF0\x9F\x98\x80\n@enduml"),
        QStringLiteral("\n\n\t  \r\n"),
    };
    for (const QString& s : sources) {
        const QString key = KeyEncoder::encode(s);
        EXPECT_FALSE(key.isEmpty());
        EXPECT_TRUE(isKeySafe(key)) << key.toStdString();
        EXPECT_EQ(key.size() % 4, 0);
    }
}

TEST(KeyEncoderTest, DistinctSourcesDistinctKeys)
{
    QSet<QString> keys;
    const int count = 200;
    for (int i = 0; i < count; ++i) {
        keys.insert(KeyEncoder::encode(QStringLiteral("@startuml\nA%1 -> B\n@enduml").arg(i)));
    }
    EXPECT_EQ(keys.size(), count);

    EXPECT_NE(KeyEncoder::encode(QStringLiteral("A->B")), KeyEncoder::encode(QStringLiteral("A->B ")));
    EXPECT_NE(KeyEncoder::encode(QStringLiteral("A->B")), KeyEncoder::encode(QStringLiteral("a->b")));
}

TEST(KeyEncoderTest, RepetitiveSourceCompresses)
{
    QString big;
    for (int i = 0; i < 500; ++i) {
        big += QStringLiteral("Alice -> Bob : ping\n");
    }
    const QString key = KeyEncoder::encode(big);
    EXPECT_LT(key.size(), big.size() / 4);
}

TEST(KeyEncoderTest, Encode64PadsShortGroups)
{
    // 0x00 0x00 0x00 -> "0000"; one byte 0xFF -> 111111 11|0000 ... -> "_m00"
    EXPECT_EQ(KeyEncoder::encode64(QByteArray(3, '\0')), QStringLiteral("0000"));
    EXPECT_EQ(KeyEncoder::encode64(QByteArray(1, '\xff')), QStringLiteral("_m00"));
    EXPECT_EQ(KeyEncoder::encode64(QByteArray()), QString());
}

TEST(KeyEncoderTest, Encode64Alphabet)
{
    // 0b000000 000001 001010 100100 -> '0' '1' 'A' 'a'
    const QByteArray bytes("\x00\x12\xA4", 3);
    EXPECT_EQ(KeyEncoder::encode64(bytes), QStringLiteral("01Aa"));

    // 111110 111111 ... -> '-' '_'
    const QByteArray high("\xFB\xFF\xFF", 3);
    EXPECT_EQ(KeyEncoder::encode64(high), QStringLiteral("-___"));
}

TEST(KeyEncoderTest, DeflateRawHasNoZlibFraming)
{
    const QByteArray raw = KeyEncoder::deflateRaw(QByteArrayLiteral("@startuml\nA->B\n@enduml"));
    ASSERT_FALSE(raw.isEmpty());
    // A zlib stream would start with 0x78.
    EXPECT_NE(static_cast<unsigned char>(raw.at(0)), 0x78);
    EXPECT_EQ(KeyEncoder::deflateRaw(QByteArray()), QByteArray("\x03\x00", 2));
}

TEST(KeyEncoderTest, SlotStorageKeysArePrefixed)
{
    const QString key = KeyEncoder::encode(kSequence);
    EXPECT_EQ((CacheSlot {CacheNamespace::Svg, key}).storageKey(), QStringLiteral("svg-") + key);
    EXPECT_EQ((CacheSlot {CacheNamespace::Png, key}).storageKey(), QStringLiteral("png-") + key);
    EXPECT_EQ((CacheSlot {CacheNamespace::Ascii, key}).storageKey(), QStringLiteral("ascii-") + key);
    EXPECT_EQ((CacheSlot {CacheNamespace::Map, key}).storageKey(), QStringLiteral("map-") + key);
    EXPECT_EQ((CacheSlot {CacheNamespace::Timestamp, key}).storageKey(), QStringLiteral("ts-") + key);
}
