#pragma once

#include "ContentHasher/Digest.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief 256-bit digest algorithms offered by the content hashers.
 */
enum class DigestAlgorithm
{
    Blake3,     /**< BLAKE3 with its default 256-bit output */
    Blake2s256, /**< BLAKE2s with a 256-bit output */
    Sha256,     /**< SHA-2 256 */
    Sha3_256    /**< SHA-3 256 */
};

/**
 * @brief Convert a DigestAlgorithm value to its command-line name.
 *
 * @param[in] algorithm The algorithm to convert
 * @return Name such as "blake3"
 */
inline const char* DigestAlgorithmToString(DigestAlgorithm algorithm)
{
    switch (algorithm)
    {
    case DigestAlgorithm::Blake3:
        return "blake3";
    case DigestAlgorithm::Blake2s256:
        return "blake2s256";
    case DigestAlgorithm::Sha256:
        return "sha256";
    case DigestAlgorithm::Sha3_256:
        return "sha3-256";
    }
    return "unknown";
}

/**
 * @brief Convert a command-line name to a DigestAlgorithm value.
 *
 * @param[in] stringValue Name to convert
 * @param[out] algorithm Matching algorithm, untouched when not recognized
 * @return false if the name is not recognized
 */
inline bool StringToDigestAlgorithm(const std::string& stringValue, DigestAlgorithm& algorithm)
{
    if ("blake3" == stringValue)
    {
        algorithm = DigestAlgorithm::Blake3;
        return true;
    }
    if ("blake2s256" == stringValue)
    {
        algorithm = DigestAlgorithm::Blake2s256;
        return true;
    }
    if ("sha256" == stringValue)
    {
        algorithm = DigestAlgorithm::Sha256;
        return true;
    }
    if ("sha3-256" == stringValue)
    {
        algorithm = DigestAlgorithm::Sha3_256;
        return true;
    }
    return false;
}

/**
 * @brief Hash capability producing fixed 32-byte digests.
 */
class ContentHasher
{
  public:
    virtual ~ContentHasher() = default;

    /**
     * @brief Hash an in-memory buffer.
     *
     * @param[in] data Bytes to hash, may be null when size is zero
     * @param[in] size Number of bytes
     * @param[out] outputDigest Resulting digest
     * @return true on success, false on error
     */
    virtual bool Compute(const std::uint8_t* data, std::size_t size, Digest& outputDigest) const = 0;

    /**
     * @brief Hash the content of a file.
     *
     * @param[in] filePath Path to the file to hash
     * @param[out] outputDigest Resulting digest
     * @return true on success, false if the file cannot be read or hashing fails
     */
    virtual bool ComputeFile(const fs::path& filePath, Digest& outputDigest) const = 0;
};

/**
 * @brief Infrastructure component hashing content with OpenSSL EVP digests.
 *
 * Covers every algorithm except Blake3, for which Compute() reports failure.
 */
class EvpContentHasher : public ContentHasher
{
  public:
    explicit EvpContentHasher(DigestAlgorithm algorithm = DigestAlgorithm::Blake2s256);

    bool Compute(const std::uint8_t* data, std::size_t size, Digest& outputDigest) const override;
    bool ComputeFile(const fs::path& filePath, Digest& outputDigest) const override;

    DigestAlgorithm Algorithm() const { return _algorithm; }

  private:
    DigestAlgorithm _algorithm;
};

/**
 * @brief Infrastructure component hashing content with the BLAKE3 C library.
 */
class Blake3ContentHasher : public ContentHasher
{
  public:
    bool Compute(const std::uint8_t* data, std::size_t size, Digest& outputDigest) const override;
    bool ComputeFile(const fs::path& filePath, Digest& outputDigest) const override;
};

/**
 * @brief Create the hasher implementing an algorithm.
 *
 * @param[in] algorithm Digest algorithm
 * @return Blake3ContentHasher for Blake3, EvpContentHasher otherwise
 */
std::unique_ptr<ContentHasher> CreateContentHasher(DigestAlgorithm algorithm);
