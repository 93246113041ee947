#pragma once

#include "ContentHasher/ContentHasher.hpp"
#include "HashId/HashId.hpp"
#include "RandomSource/RandomSource.hpp"
#include "TimestampProvider/TimestampProvider.hpp"

#include <optional>

/**
 * @brief Amount of random input material hashed into a random identifier.
 */
enum class RandomWidth : std::size_t
{
    Bytes32 = 32,
    Bytes64 = 64
};

/**
 * @brief Builds identifiers whose digest is the hash of fresh random bytes.
 *
 * The random bytes only feed the hash function and are wiped afterwards.
 */
class RandomHashIdGenerator
{
  public:
    RandomHashIdGenerator(const TimestampProvider& timestampProvider, const ContentHasher& contentHasher, const RandomSource& randomSource);

    /**
     * @brief Draw width random bytes, hash them and stamp the result with the current instant.
     *
     * @param[in] width Number of random bytes to hash
     * @return Identifier, or empty if the random source or the hasher failed
     */
    std::optional<HashId> Generate(RandomWidth width = RandomWidth::Bytes32) const;

  private:
    const TimestampProvider& _timestampProvider;
    const ContentHasher& _contentHasher;
    const RandomSource& _randomSource;
};
