#pragma once

#include <array>
#include <cstdint>
#include <string>

/** Size in bytes of a 256-bit content digest. */
constexpr std::size_t DigestSize = 32;

using DigestBytes = std::array<std::uint8_t, DigestSize>;

/**
 * @brief Fixed-width output of a 256-bit cryptographic hash function.
 *
 * Any 32 bytes form a valid digest, so construction from raw bytes cannot fail.
 */
class Digest
{
  public:
    Digest();
    explicit Digest(const DigestBytes& bytes);

    const DigestBytes& Bytes() const { return _bytes; }

    /**
     * @brief Lower-case hex rendering, 64 characters.
     */
    std::string ToHex() const;

    /**
     * @brief Parse 64 hex characters (either case).
     *
     * @param[in] hexText Hex text
     * @param[out] output Parsed digest, untouched on failure
     * @return false on wrong length or non-hex characters
     */
    static bool FromHex(const std::string& hexText, Digest& output);

    bool operator==(const Digest& other) const { return _bytes == other._bytes; }
    bool operator!=(const Digest& other) const { return _bytes != other._bytes; }
    bool operator<(const Digest& other) const { return _bytes < other._bytes; }

  private:
    DigestBytes _bytes;
};
