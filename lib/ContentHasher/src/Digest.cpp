#include "ContentHasher/Digest.hpp"
#include "ContentHasher/HexEncoding.hpp"

Digest::Digest()
    : _bytes{}
{
}

Digest::Digest(const DigestBytes& bytes)
    : _bytes(bytes)
{
}

std::string Digest::ToHex() const
{
    return BytesToHex(_bytes.data(), _bytes.size());
}

bool Digest::FromHex(const std::string& hexText, Digest& output)
{
    DigestBytes bytes{};
    if (false == HexToBytes(hexText, bytes.data(), bytes.size()))
    {
        return false;
    }

    output = Digest(bytes);
    return true;
}
