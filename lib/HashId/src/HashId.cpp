#include "HashId/HashId.hpp"
#include "ContentHasher/HexEncoding.hpp"

#include <algorithm>
#include <tuple>

#include <xxhash.h>

namespace
{
constexpr XXH64_hash_t HashSeed = 0;
constexpr std::size_t TimestampHexLength = Tai64NSize * 2;

Tai64NBytes SliceTimestamp(const std::uint8_t* data)
{
    Tai64NBytes bytes{};
    std::copy(data + HashIdTimestampOffset, data + HashIdTimestampOffset + Tai64NSize, bytes.begin());
    return bytes;
}

DigestBytes SliceDigest(const std::uint8_t* data)
{
    DigestBytes bytes{};
    std::copy(data + HashIdDigestOffset, data + HashIdDigestOffset + DigestSize, bytes.begin());
    return bytes;
}
}

HashId::HashId()
    : _timestamp()
    , _digest()
{
}

HashId::HashId(const Tai64N& timestamp, const Digest& digest)
    : _timestamp(timestamp)
    , _digest(digest)
{
}

HashId HashId::Create(const Digest& digest, const TimestampProvider& timestampProvider)
{
    return HashId(timestampProvider.Now(), digest);
}

EncodedHashId HashId::Encode() const
{
    EncodedHashId encoded{};

    const Tai64NBytes timestampBytes = _timestamp.ToBytes();
    std::copy(timestampBytes.begin(), timestampBytes.end(), encoded.begin() + HashIdTimestampOffset);

    const DigestBytes& digestBytes = _digest.Bytes();
    std::copy(digestBytes.begin(), digestBytes.end(), encoded.begin() + HashIdDigestOffset);

    return encoded;
}

HashIdStatus HashId::DecodeTimestamp(const EncodedHashId& encoded, Tai64N& outputTimestamp)
{
    if (false == Tai64N::FromBytes(SliceTimestamp(encoded.data()), outputTimestamp))
    {
        return HashIdStatus::MalformedTimestamp;
    }
    return HashIdStatus::Ok;
}

Digest HashId::DecodeDigest(const EncodedHashId& encoded)
{
    return Digest(SliceDigest(encoded.data()));
}

HashIdStatus HashId::Decode(const EncodedHashId& encoded, HashId& output)
{
    Tai64N timestamp;
    const HashIdStatus status = DecodeTimestamp(encoded, timestamp);
    if (HashIdStatus::Ok != status)
    {
        return status;
    }

    output = HashId(timestamp, DecodeDigest(encoded));
    return HashIdStatus::Ok;
}

HashIdStatus HashId::DecodeBytes(const std::uint8_t* data, std::size_t size, HashId& output)
{
    if (Tai64NSize > size)
    {
        return HashIdStatus::MalformedTimestamp;
    }
    if (EncodedHashIdSize != size)
    {
        return HashIdStatus::MalformedDigest;
    }

    EncodedHashId encoded{};
    std::copy(data, data + EncodedHashIdSize, encoded.begin());
    return Decode(encoded, output);
}

std::string HashId::ToHex() const
{
    const EncodedHashId encoded = Encode();
    return BytesToHex(encoded.data(), encoded.size());
}

HashIdStatus HashId::FromHex(const std::string& hexText, HashId& output)
{
    if (TimestampHexLength > hexText.size())
    {
        return HashIdStatus::MalformedTimestamp;
    }

    Tai64NBytes timestampBytes{};
    Tai64N timestamp;
    if ((false == HexToBytes(hexText.substr(0, TimestampHexLength), timestampBytes.data(), timestampBytes.size())) ||
        (false == Tai64N::FromBytes(timestampBytes, timestamp)))
    {
        return HashIdStatus::MalformedTimestamp;
    }

    Digest digest;
    if (false == Digest::FromHex(hexText.substr(TimestampHexLength), digest))
    {
        return HashIdStatus::MalformedDigest;
    }

    output = HashId(timestamp, digest);
    return HashIdStatus::Ok;
}

bool HashId::operator==(const HashId& other) const
{
    return (_timestamp == other._timestamp) && (_digest == other._digest);
}

bool HashId::operator!=(const HashId& other) const
{
    return !(*this == other);
}

bool HashId::operator<(const HashId& other) const
{
    return std::tie(_timestamp, _digest) < std::tie(other._timestamp, other._digest);
}

bool HashId::operator>(const HashId& other) const
{
    return other < *this;
}

bool HashId::operator<=(const HashId& other) const
{
    return !(other < *this);
}

bool HashId::operator>=(const HashId& other) const
{
    return !(*this < other);
}

std::size_t HashIdHasher::operator()(const HashId& hashId) const
{
    const EncodedHashId encoded = hashId.Encode();
    return static_cast<std::size_t>(XXH64(encoded.data(), encoded.size(), HashSeed));
}
