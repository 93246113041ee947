/**
 * @file hash_id_tests.cpp
 * @brief Tests for identifier construction, canonical encoding and decoding.
 */
#include "ContentHasher/ContentHasher.hpp"
#include "HashId/HashId.hpp"
#include "helpers/TestHelpers.hpp"
#include "gtest/gtest.h"
#include <gmock/gmock.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <unordered_set>
#include <vector>

using ::testing::Return;

class HashIdTest : public ::testing::Test
{
  protected:
    const Tai64N instant = UnixInstant(1700000000, 123456789);
    const FixedTimestampProvider clock{instant};
};

TEST_F(HashIdTest, Create_ReadsClockExactlyOnce)
{
    MockTimestampProvider mockClock;
    EXPECT_CALL(mockClock, Now()).Times(1).WillOnce(Return(instant));

    const HashId hashId = HashId::Create(FilledDigest(0x01), mockClock);

    EXPECT_EQ(instant, hashId.Timestamp());
    EXPECT_EQ(FilledDigest(0x01), hashId.ContentDigest());
}

TEST_F(HashIdTest, Create_SameDigestAtDifferentInstantsDiffers)
{
    MockTimestampProvider mockClock;
    EXPECT_CALL(mockClock, Now()).WillOnce(Return(UnixInstant(10, 0))).WillOnce(Return(UnixInstant(10, 1)));

    const HashId first = HashId::Create(FilledDigest(0x01), mockClock);
    const HashId second = HashId::Create(FilledDigest(0x01), mockClock);

    EXPECT_NE(first, second);
    EXPECT_LT(first, second);
}

TEST_F(HashIdTest, Create_SameInstantAndDigestAreEqual)
{
    EXPECT_EQ(HashId::Create(FilledDigest(0x01), clock), HashId::Create(FilledDigest(0x01), clock));
}

TEST_F(HashIdTest, Encode_PlacesTimestampThenDigest)
{
    // Arrange
    DigestBytes digestBytes{};
    for (std::size_t index = 0; index < digestBytes.size(); ++index)
    {
        digestBytes[index] = static_cast<std::uint8_t>(0xA0 + index);
    }
    const HashId hashId = HashId::Create(Digest(digestBytes), clock);

    // Act
    const EncodedHashId encoded = hashId.Encode();

    // Assert
    ASSERT_EQ(44u, encoded.size());
    const Tai64NBytes timestampBytes = instant.ToBytes();
    EXPECT_TRUE(std::equal(timestampBytes.begin(), timestampBytes.end(), encoded.begin()));
    EXPECT_TRUE(std::equal(digestBytes.begin(), digestBytes.end(), encoded.begin() + 12));
}

TEST_F(HashIdTest, Encode_IsDeterministic)
{
    const HashId hashId = HashId::Create(FilledDigest(0x5A), clock);

    EXPECT_EQ(hashId.Encode(), hashId.Encode());
    const HashId copy = hashId;
    EXPECT_EQ(hashId.Encode(), copy.Encode());
}

TEST_F(HashIdTest, ZeroMessageExample_EncodesExactLayout)
{
    // Arrange: BLAKE3 of eight zero bytes at a fixed instant
    const std::uint8_t message[8] = {0, 0, 0, 0, 0, 0, 0, 0};
    const Blake3ContentHasher contentHasher{};
    Digest zeroDigest;
    ASSERT_TRUE(contentHasher.Compute(message, sizeof(message), zeroDigest));
    ASSERT_EQ("71e0a99173564931c0b8acc52d2685a8e39c64dc52e3d02390fdac2a12b155cb", zeroDigest.ToHex());

    const Tai64N fixedInstant = UnixInstant(1600000000, 500);
    const FixedTimestampProvider fixedClock(fixedInstant);

    // Act
    const EncodedHashId encoded = HashId::Create(zeroDigest, fixedClock).Encode();

    // Assert
    const Tai64NBytes expectedTimestamp = {0x40, 0x00, 0x00, 0x00, 0x5F, 0x5E, 0x10, 0x0A, 0x00, 0x00, 0x01, 0xF4};
    EXPECT_TRUE(std::equal(expectedTimestamp.begin(), expectedTimestamp.end(), encoded.begin()));
    EXPECT_TRUE(std::equal(zeroDigest.Bytes().begin(), zeroDigest.Bytes().end(), encoded.begin() + 12));

    Tai64N decodedTimestamp;
    ASSERT_EQ(HashIdStatus::Ok, HashId::DecodeTimestamp(encoded, decodedTimestamp));
    EXPECT_EQ(fixedInstant, decodedTimestamp);
    EXPECT_EQ(zeroDigest, HashId::DecodeDigest(encoded));
    EXPECT_EQ("400000005f5e100a000001f4" "71e0a99173564931c0b8acc52d2685a8e39c64dc52e3d02390fdac2a12b155cb", HashId::Create(zeroDigest, fixedClock).ToHex());
}

TEST_F(HashIdTest, SystemClockIdentifiers_AlwaysDecode)
{
    // Arrange: a live reading and the extremes of the system clock
    const SystemTimestampProvider systemClock{};
    const Tai64N instants[] = {
        systemClock.Now(),
        Tai64N::FromSystemTime(std::chrono::system_clock::time_point::min()),
        Tai64N::FromSystemTime(std::chrono::system_clock::time_point::max()),
        Tai64N::FromSystemTime(std::chrono::system_clock::time_point()),
    };

    for (const auto& timestamp : instants)
    {
        // Act
        const FixedTimestampProvider fixedClock(timestamp);
        const HashId hashId = HashId::Create(FilledDigest(0x42), fixedClock);
        HashId decoded;
        const HashIdStatus status = HashId::Decode(hashId.Encode(), decoded);

        // Assert
        ASSERT_EQ(HashIdStatus::Ok, status);
        EXPECT_EQ(hashId, decoded);
    }
}

TEST_F(HashIdTest, FarRangeLabels_RoundTripAndKeepOrder)
{
    const HashId lowest(Tai64N::FromLabel(0, 0).value(), FilledDigest(0xFF));
    const HashId highest(Tai64N::FromLabel(Tai64N::ReservedLabel - 1, Tai64N::NanosPerSecond - 1).value(), FilledDigest(0x00));

    HashId decoded;
    ASSERT_EQ(HashIdStatus::Ok, HashId::Decode(lowest.Encode(), decoded));
    EXPECT_EQ(lowest, decoded);
    ASSERT_EQ(HashIdStatus::Ok, HashId::Decode(highest.Encode(), decoded));
    EXPECT_EQ(highest, decoded);

    ASSERT_EQ(HashIdStatus::Ok, HashId::FromHex(highest.ToHex(), decoded));
    EXPECT_EQ(highest, decoded);
    EXPECT_EQ("7fffffffffffffff3b9ac9ff", highest.ToHex().substr(0, 24));

    EXPECT_LT(lowest, highest);
    EXPECT_LT(lowest.Encode(), highest.Encode());
}

TEST_F(HashIdTest, DecodeDigest_RoundTripsAnyDigest)
{
    const std::uint8_t values[] = {0x00, 0x7F, 0x80, 0xFF};
    for (const std::uint8_t value : values)
    {
        const Digest digest = FilledDigest(value);
        EXPECT_EQ(digest, HashId::DecodeDigest(HashId::Create(digest, clock).Encode()));
    }
}

TEST_F(HashIdTest, DecodeTimestamp_RejectsInvalidNanoseconds)
{
    EncodedHashId encoded = HashId::Create(FilledDigest(0x01), clock).Encode();
    // nanosecond field 0xFFFFFFFF
    encoded[8] = 0xFF;
    encoded[9] = 0xFF;
    encoded[10] = 0xFF;
    encoded[11] = 0xFF;

    const Tai64N untouched = UnixInstant(3, 3);
    Tai64N decodedTimestamp = untouched;
    EXPECT_EQ(HashIdStatus::MalformedTimestamp, HashId::DecodeTimestamp(encoded, decodedTimestamp));
    EXPECT_EQ(untouched, decodedTimestamp);

    // the digest half stays readable
    EXPECT_EQ(FilledDigest(0x01), HashId::DecodeDigest(encoded));
}

TEST_F(HashIdTest, Decode_RecoversWholeIdentifier)
{
    const HashId hashId = HashId::Create(FilledDigest(0x33), clock);

    HashId decoded;
    ASSERT_EQ(HashIdStatus::Ok, HashId::Decode(hashId.Encode(), decoded));
    EXPECT_EQ(hashId, decoded);
}

TEST_F(HashIdTest, Decode_ReservedLabelIsMalformedTimestamp)
{
    EncodedHashId encoded = HashId::Create(FilledDigest(0x33), clock).Encode();
    encoded[0] = 0x80;

    const HashId untouched = HashId::Create(FilledDigest(0x44), clock);
    HashId decoded = untouched;
    EXPECT_EQ(HashIdStatus::MalformedTimestamp, HashId::Decode(encoded, decoded));
    EXPECT_EQ(untouched, decoded);
}

TEST_F(HashIdTest, DecodeBytes_ChecksLength)
{
    const EncodedHashId encoded = HashId::Create(FilledDigest(0x33), clock).Encode();
    std::vector<std::uint8_t> buffer(encoded.begin(), encoded.end());
    HashId decoded;

    EXPECT_EQ(HashIdStatus::MalformedTimestamp, HashId::DecodeBytes(buffer.data(), 11, decoded));
    EXPECT_EQ(HashIdStatus::MalformedDigest, HashId::DecodeBytes(buffer.data(), 12, decoded));
    EXPECT_EQ(HashIdStatus::MalformedDigest, HashId::DecodeBytes(buffer.data(), 43, decoded));

    buffer.push_back(0x00);
    EXPECT_EQ(HashIdStatus::MalformedDigest, HashId::DecodeBytes(buffer.data(), buffer.size(), decoded));

    EXPECT_EQ(HashIdStatus::Ok, HashId::DecodeBytes(buffer.data(), 44, decoded));
    EXPECT_EQ(HashId::Create(FilledDigest(0x33), clock), decoded);
}

TEST_F(HashIdTest, Ordering_TimestampDominatesDigest)
{
    // Arrange: earlier id carries the larger digest
    const HashId earlier(UnixInstant(1000, 0), FilledDigest(0xFF));
    const HashId later(UnixInstant(1000, 1), FilledDigest(0x00));

    // Assert
    EXPECT_LT(earlier, later);
    EXPECT_LT(earlier.Encode(), later.Encode());
}

TEST_F(HashIdTest, Ordering_DigestBreaksTimestampTies)
{
    const HashId lower(instant, FilledDigest(0x01));
    const HashId higher(instant, FilledDigest(0x02));

    EXPECT_LT(lower, higher);
    EXPECT_GT(higher, lower);
    EXPECT_LE(lower, lower);
    EXPECT_GE(higher, higher);
    EXPECT_LT(lower.Encode(), higher.Encode());
}

TEST_F(HashIdTest, Ordering_SortedIdentifiersMatchSortedEncodings)
{
    std::vector<HashId> hashIds = {
        HashId(UnixInstant(5, 0), FilledDigest(0x10)),
        HashId(UnixInstant(-5, 0), FilledDigest(0x20)),
        HashId(UnixInstant(5, 999999999), FilledDigest(0x00)),
        HashId(UnixInstant(5, 0), FilledDigest(0x01)),
        HashId(UnixInstant(1LL << 40, 0), FilledDigest(0x00)),
    };

    std::vector<EncodedHashId> encodings;
    for (const auto& hashId : hashIds)
    {
        encodings.push_back(hashId.Encode());
    }

    std::sort(hashIds.begin(), hashIds.end());
    std::sort(encodings.begin(), encodings.end());

    for (std::size_t index = 0; index < hashIds.size(); ++index)
    {
        EXPECT_EQ(encodings[index], hashIds[index].Encode());
    }
}

TEST_F(HashIdTest, ToHex_IsEightyEightLowerCaseCharacters)
{
    const HashId hashId(UnixInstant(0, 0), FilledDigest(0xAB));

    const std::string hexText = hashId.ToHex();

    EXPECT_EQ(88u, hexText.size());
    std::string expected = "400000000000000a" "00000000";
    for (int index = 0; index < 32; ++index)
    {
        expected += "ab";
    }
    EXPECT_EQ(expected, hexText);
}

TEST_F(HashIdTest, FromHex_RoundTrips)
{
    const HashId hashId = HashId::Create(FilledDigest(0x9C), clock);

    HashId parsed;
    ASSERT_EQ(HashIdStatus::Ok, HashId::FromHex(hashId.ToHex(), parsed));
    EXPECT_EQ(hashId, parsed);
}

TEST_F(HashIdTest, FromHex_ReportsFieldOfTheFault)
{
    const std::string hexText = HashId::Create(FilledDigest(0x9C), clock).ToHex();
    HashId parsed;

    EXPECT_EQ(HashIdStatus::MalformedTimestamp, HashId::FromHex("", parsed));
    EXPECT_EQ(HashIdStatus::MalformedTimestamp, HashId::FromHex(hexText.substr(0, 20), parsed));
    EXPECT_EQ(HashIdStatus::MalformedTimestamp, HashId::FromHex("x" + hexText.substr(1), parsed));
    EXPECT_EQ(HashIdStatus::MalformedTimestamp, HashId::FromHex("8" + hexText.substr(1), parsed));
    EXPECT_EQ(HashIdStatus::MalformedDigest, HashId::FromHex(hexText.substr(0, 24), parsed));
    EXPECT_EQ(HashIdStatus::MalformedDigest, HashId::FromHex(hexText.substr(0, 87), parsed));
    EXPECT_EQ(HashIdStatus::MalformedDigest, HashId::FromHex(hexText + "00", parsed));
    EXPECT_EQ(HashIdStatus::MalformedDigest, HashId::FromHex(hexText.substr(0, 87) + "g", parsed));
}

TEST_F(HashIdTest, Hashing_SupportsUnorderedContainers)
{
    const HashId first(instant, FilledDigest(0x01));
    const HashId second(instant, FilledDigest(0x02));

    std::unordered_set<HashId> hashIds;
    hashIds.insert(first);
    hashIds.insert(second);
    hashIds.insert(HashId(instant, FilledDigest(0x01)));

    EXPECT_EQ(2u, hashIds.size());
    EXPECT_EQ(std::hash<HashId>()(first), HashIdHasher()(HashId(instant, FilledDigest(0x01))));
}

TEST(HashIdStatusTest, ToString)
{
    EXPECT_STREQ("Ok", HashIdStatusToString(HashIdStatus::Ok));
    EXPECT_STREQ("MalformedTimestamp", HashIdStatusToString(HashIdStatus::MalformedTimestamp));
    EXPECT_STREQ("MalformedDigest", HashIdStatusToString(HashIdStatus::MalformedDigest));
}
