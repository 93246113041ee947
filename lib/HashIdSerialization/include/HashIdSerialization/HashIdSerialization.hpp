#pragma once

#include "HashId/HashId.hpp"

#include <cstdint>
#include <vector>

/** Version tag written in front of every serialized identifier. */
constexpr std::uint8_t HashIdRecordVersion = 1;

/** Serialized record: version byte followed by the canonical encoding. */
constexpr std::size_t HashIdRecordSize = 1 + EncodedHashIdSize;

/**
 * @brief Outcome of reading a serialized identifier.
 */
enum class SerializationStatus
{
    Ok,                 /**< Record read and offset advanced */
    Truncated,          /**< Fewer than HashIdRecordSize bytes remain */
    UnsupportedVersion, /**< Version byte is not HashIdRecordVersion */
    MalformedTimestamp  /**< Payload timestamp rejected by the TAI64N codec */
};

/**
 * @brief Convert a SerializationStatus value to its string representation.
 *
 * @param[in] status The status to convert
 * @return String representation of the status
 */
inline const char* SerializationStatusToString(SerializationStatus status)
{
    switch (status)
    {
    case SerializationStatus::Ok:
        return "Ok";
    case SerializationStatus::Truncated:
        return "Truncated";
    case SerializationStatus::UnsupportedVersion:
        return "UnsupportedVersion";
    case SerializationStatus::MalformedTimestamp:
        return "MalformedTimestamp";
    }
    return "Unknown";
}

/**
 * @brief Append a versioned record for an identifier to a byte buffer.
 *
 * @param[in,out] buffer Destination, grows by HashIdRecordSize bytes
 * @param[in] hashId Identifier to write
 */
void AppendHashId(std::vector<std::uint8_t>& buffer, const HashId& hashId);

/**
 * @brief Read one versioned record.
 *
 * @param[in] data Buffer start
 * @param[in] size Buffer length
 * @param[in,out] offset Position of the record, advanced past it only on success
 * @param[out] output Decoded identifier, untouched on failure
 * @return Status of the read
 */
SerializationStatus ReadHashId(const std::uint8_t* data, std::size_t size, std::size_t& offset, HashId& output);
