#include "HashIdSerialization/HashIdSerialization.hpp"

#include <algorithm>

void AppendHashId(std::vector<std::uint8_t>& buffer, const HashId& hashId)
{
    const EncodedHashId encoded = hashId.Encode();
    buffer.reserve(buffer.size() + HashIdRecordSize);
    buffer.push_back(HashIdRecordVersion);
    buffer.insert(buffer.end(), encoded.begin(), encoded.end());
}

SerializationStatus ReadHashId(const std::uint8_t* data, std::size_t size, std::size_t& offset, HashId& output)
{
    if ((offset > size) || (HashIdRecordSize > (size - offset)))
    {
        return SerializationStatus::Truncated;
    }

    const std::uint8_t* record = data + offset;
    if (HashIdRecordVersion != record[0])
    {
        return SerializationStatus::UnsupportedVersion;
    }

    EncodedHashId encoded{};
    std::copy(record + 1, record + HashIdRecordSize, encoded.begin());

    HashId decoded;
    if (HashIdStatus::Ok != HashId::Decode(encoded, decoded))
    {
        return SerializationStatus::MalformedTimestamp;
    }

    output = decoded;
    offset += HashIdRecordSize;
    return SerializationStatus::Ok;
}
