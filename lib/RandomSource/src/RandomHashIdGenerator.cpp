#include "RandomSource/RandomHashIdGenerator.hpp"

#include <vector>

#include <openssl/crypto.h>

RandomHashIdGenerator::RandomHashIdGenerator(const TimestampProvider& timestampProvider, const ContentHasher& contentHasher,
                                             const RandomSource& randomSource)
    : _timestampProvider(timestampProvider)
    , _contentHasher(contentHasher)
    , _randomSource(randomSource)
{
}

std::optional<HashId> RandomHashIdGenerator::Generate(RandomWidth width) const
{
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(width));

    Digest digest;
    const bool succeeded = (_randomSource.Fill(buffer.data(), buffer.size())) && (_contentHasher.Compute(buffer.data(), buffer.size(), digest));
    OPENSSL_cleanse(buffer.data(), buffer.size());

    if (false == succeeded)
    {
        return std::nullopt;
    }

    return HashId::Create(digest, _timestampProvider);
}
