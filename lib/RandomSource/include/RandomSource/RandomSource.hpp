#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief Capability filling buffers with cryptographically secure random bytes.
 */
class RandomSource
{
  public:
    virtual ~RandomSource() = default;

    /**
     * @brief Fill a buffer with random bytes.
     *
     * @param[out] buffer Destination
     * @param[in] size Number of bytes to write
     * @return true on success, false if the generator could not supply the bytes
     */
    virtual bool Fill(std::uint8_t* buffer, std::size_t size) const = 0;
};

/**
 * @brief Infrastructure component drawing bytes from the OpenSSL CSPRNG.
 */
class OpenSslRandomSource : public RandomSource
{
  public:
    bool Fill(std::uint8_t* buffer, std::size_t size) const override;
};
