#include "RandomSource/RandomSource.hpp"

#include <limits>

#include <openssl/rand.h>

bool OpenSslRandomSource::Fill(std::uint8_t* buffer, std::size_t size) const
{
    if (static_cast<std::size_t>(std::numeric_limits<int>::max()) < size)
    {
        return false;
    }
    if (0 == size)
    {
        return true;
    }
    return 1 == RAND_bytes(buffer, static_cast<int>(size));
}
