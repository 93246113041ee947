#include "ContentHasher/ContentHasher.hpp"

#include <fstream>
#include <functional>
#include <memory>

#include <blake3.h>
#include <openssl/evp.h>

namespace
{
constexpr std::size_t FileReadBufferSize = 8192;

struct DigestContextDeleter
{
    void operator()(EVP_MD_CTX* context) const
    {
        EVP_MD_CTX_free(context);
    }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

static_assert(DigestSize == BLAKE3_OUT_LEN, "BLAKE3 default output must fill a Digest");

/**
 * @brief Feed a file to a consumer in FileReadBufferSize chunks.
 *
 * @return false if the file cannot be opened or read, or the consumer fails
 */
bool ReadFileChunks(const fs::path& filePath, const std::function<bool(const char*, std::size_t)>& consume)
{
    std::ifstream inputStream(filePath, std::ios::binary);
    if (false == inputStream.is_open())
    {
        return false;
    }

    char buffer[FileReadBufferSize];
    const std::streamsize bufferSize = static_cast<std::streamsize>(sizeof(buffer));
    while (true)
    {
        inputStream.read(buffer, bufferSize);
        const std::streamsize bytesRead = inputStream.gcount();
        if (0 == bytesRead)
        {
            break;
        }
        if (false == consume(buffer, static_cast<std::size_t>(bytesRead)))
        {
            return false;
        }
        if (bufferSize > bytesRead)
        {
            break;
        }
    }

    return false == inputStream.bad();
}

const EVP_MD* SelectDigest(DigestAlgorithm algorithm)
{
    switch (algorithm)
    {
    case DigestAlgorithm::Blake2s256:
        return EVP_blake2s256();
    case DigestAlgorithm::Sha256:
        return EVP_sha256();
    case DigestAlgorithm::Sha3_256:
        return EVP_sha3_256();
    case DigestAlgorithm::Blake3:
        return nullptr;
    }
    return nullptr;
}

DigestContext BeginDigest(DigestAlgorithm algorithm)
{
    const EVP_MD* messageDigest = SelectDigest(algorithm);
    if ((nullptr == messageDigest) || (static_cast<int>(DigestSize) != EVP_MD_size(messageDigest)))
    {
        return nullptr;
    }

    DigestContext context(EVP_MD_CTX_new());
    if (nullptr == context)
    {
        return nullptr;
    }

    if (1 != EVP_DigestInit_ex(context.get(), messageDigest, nullptr))
    {
        return nullptr;
    }
    return context;
}

bool FinishDigest(EVP_MD_CTX* context, Digest& outputDigest)
{
    DigestBytes bytes{};
    unsigned int length = 0;
    if ((1 != EVP_DigestFinal_ex(context, bytes.data(), &length)) || (DigestSize != length))
    {
        return false;
    }

    outputDigest = Digest(bytes);
    return true;
}
}

EvpContentHasher::EvpContentHasher(DigestAlgorithm algorithm)
    : _algorithm(algorithm)
{
}

bool EvpContentHasher::Compute(const std::uint8_t* data, std::size_t size, Digest& outputDigest) const
{
    DigestContext context = BeginDigest(_algorithm);
    if (nullptr == context)
    {
        return false;
    }

    if ((0 < size) && (1 != EVP_DigestUpdate(context.get(), data, size)))
    {
        return false;
    }

    return FinishDigest(context.get(), outputDigest);
}

bool EvpContentHasher::ComputeFile(const fs::path& filePath, Digest& outputDigest) const
{
    DigestContext context = BeginDigest(_algorithm);
    if (nullptr == context)
    {
        return false;
    }

    const bool fileRead = ReadFileChunks(filePath, [&context](const char* chunk, std::size_t size) {
        return 1 == EVP_DigestUpdate(context.get(), chunk, size);
    });
    if (false == fileRead)
    {
        return false;
    }

    return FinishDigest(context.get(), outputDigest);
}

bool Blake3ContentHasher::Compute(const std::uint8_t* data, std::size_t size, Digest& outputDigest) const
{
    if ((nullptr == data) && (0 < size))
    {
        return false;
    }

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    if (0 < size)
    {
        blake3_hasher_update(&hasher, data, size);
    }

    DigestBytes bytes{};
    blake3_hasher_finalize(&hasher, bytes.data(), bytes.size());
    outputDigest = Digest(bytes);
    return true;
}

bool Blake3ContentHasher::ComputeFile(const fs::path& filePath, Digest& outputDigest) const
{
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);

    const bool fileRead = ReadFileChunks(filePath, [&hasher](const char* chunk, std::size_t size) {
        blake3_hasher_update(&hasher, chunk, size);
        return true;
    });
    if (false == fileRead)
    {
        return false;
    }

    DigestBytes bytes{};
    blake3_hasher_finalize(&hasher, bytes.data(), bytes.size());
    outputDigest = Digest(bytes);
    return true;
}

std::unique_ptr<ContentHasher> CreateContentHasher(DigestAlgorithm algorithm)
{
    if (DigestAlgorithm::Blake3 == algorithm)
    {
        return std::make_unique<Blake3ContentHasher>();
    }
    return std::make_unique<EvpContentHasher>(algorithm);
}
