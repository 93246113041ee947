#pragma once

#include "ContentHasher/Digest.hpp"
#include "TimestampProvider/Tai64N.hpp"
#include "TimestampProvider/TimestampProvider.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <string>

constexpr std::size_t HashIdTimestampOffset = 0;
constexpr std::size_t HashIdDigestOffset = HashIdTimestampOffset + Tai64NSize;

/** Total width of the canonical encoding: 12 timestamp bytes then 32 digest bytes. */
constexpr std::size_t EncodedHashIdSize = HashIdDigestOffset + DigestSize;

using EncodedHashId = std::array<std::uint8_t, EncodedHashIdSize>;

/**
 * @brief Outcome of decoding an identifier or one of its fields.
 */
enum class HashIdStatus
{
    Ok,                 /**< Decoding succeeded */
    MalformedTimestamp, /**< Leading 12 bytes are not a valid TAI64N label */
    MalformedDigest     /**< Trailing bytes do not form a 32-byte digest */
};

/**
 * @brief Convert a HashIdStatus value to its string representation.
 *
 * @param[in] status The status to convert
 * @return String representation of the status
 */
inline const char* HashIdStatusToString(HashIdStatus status)
{
    switch (status)
    {
    case HashIdStatus::Ok:
        return "Ok";
    case HashIdStatus::MalformedTimestamp:
        return "MalformedTimestamp";
    case HashIdStatus::MalformedDigest:
        return "MalformedDigest";
    }
    return "Unknown";
}

/**
 * @brief Sortable identifier pairing a TAI64N creation instant with a content digest.
 *
 * Values are immutable. Equality and ordering compare the timestamp first and
 * the digest second, which is the byte-lexicographic order of Encode().
 */
class HashId
{
  public:
    /**
     * @brief Identifier at the Unix epoch with an all-zero digest.
     */
    HashId();

    /**
     * @brief Pair an existing instant with a digest without reading a clock.
     *
     * @param[in] timestamp Creation instant
     * @param[in] digest Content digest
     */
    HashId(const Tai64N& timestamp, const Digest& digest);

    /**
     * @brief Pair a digest with the instant reported by the clock.
     *
     * @param[in] digest Content digest
     * @param[in] timestampProvider Clock read once during the call
     * @return New identifier
     */
    static HashId Create(const Digest& digest, const TimestampProvider& timestampProvider);

    /** Creation instant, bytes [0,12) of the encoding. */
    const Tai64N& Timestamp() const { return _timestamp; }
    /** Content digest, bytes [12,44) of the encoding. */
    const Digest& ContentDigest() const { return _digest; }

    /**
     * @brief Canonical 44-byte encoding.
     *
     * Bytes [0,12) hold the TAI64N label and bytes [12,44) the digest.
     */
    EncodedHashId Encode() const;

    /**
     * @brief Recover the timestamp from bytes [0,12) of an encoding.
     *
     * @param[in] encoded Canonical encoding
     * @param[out] outputTimestamp Parsed instant, untouched on failure
     * @return Ok, or MalformedTimestamp when the label is rejected by the TAI64N codec
     */
    static HashIdStatus DecodeTimestamp(const EncodedHashId& encoded, Tai64N& outputTimestamp);

    /**
     * @brief Recover the digest from bytes [12,44) of an encoding.
     *
     * Any 32 bytes are a valid digest, so this cannot fail.
     *
     * @param[in] encoded Canonical encoding
     * @return Digest stored in the encoding
     */
    static Digest DecodeDigest(const EncodedHashId& encoded);

    /**
     * @brief Recover the whole identifier from its encoding.
     *
     * @param[in] encoded Canonical encoding
     * @param[out] output Decoded identifier, untouched on failure
     * @return Ok or MalformedTimestamp
     */
    static HashIdStatus Decode(const EncodedHashId& encoded, HashId& output);

    /**
     * @brief Recover the identifier from a buffer of unchecked length.
     *
     * Fewer than 12 bytes yield MalformedTimestamp. Any other length than 44
     * yields MalformedDigest.
     *
     * @param[in] data Buffer start, may be null when size is zero
     * @param[in] size Buffer length
     * @param[out] output Decoded identifier, untouched on failure
     * @return Ok, MalformedTimestamp or MalformedDigest
     */
    static HashIdStatus DecodeBytes(const std::uint8_t* data, std::size_t size, HashId& output);

    /**
     * @brief Lower-case hex of the canonical encoding, 88 characters.
     */
    std::string ToHex() const;

    /**
     * @brief Parse the text produced by ToHex().
     *
     * The first 24 characters must be a valid TAI64N label in hex, otherwise
     * MalformedTimestamp. The rest must be exactly 64 hex characters, otherwise
     * MalformedDigest.
     */
    static HashIdStatus FromHex(const std::string& hexText, HashId& output);

    bool operator==(const HashId& other) const;
    bool operator!=(const HashId& other) const;
    bool operator<(const HashId& other) const;
    bool operator>(const HashId& other) const;
    bool operator<=(const HashId& other) const;
    bool operator>=(const HashId& other) const;

  private:
    Tai64N _timestamp;
    Digest _digest;
};

/**
 * @brief XXH64 of the canonical encoding, for unordered containers.
 */
struct HashIdHasher
{
    std::size_t operator()(const HashId& hashId) const;
};

namespace std
{
template <>
struct hash<HashId>
{
    std::size_t operator()(const HashId& hashId) const
    {
        return HashIdHasher()(hashId);
    }
};
} // namespace std
