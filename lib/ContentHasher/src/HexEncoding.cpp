#include "ContentHasher/HexEncoding.hpp"

#include <vector>

namespace
{
const char HexDigits[] = "0123456789abcdef";

int HexValue(char character)
{
    if (('0' <= character) && ('9' >= character))
    {
        return character - '0';
    }
    if (('a' <= character) && ('f' >= character))
    {
        return 10 + (character - 'a');
    }
    if (('A' <= character) && ('F' >= character))
    {
        return 10 + (character - 'A');
    }
    return -1;
}
}

std::string BytesToHex(const std::uint8_t* data, std::size_t size)
{
    std::string hexText(size * 2, '0');
    for (std::size_t index = 0; index < size; ++index)
    {
        hexText[2 * index] = HexDigits[data[index] >> 4];
        hexText[2 * index + 1] = HexDigits[data[index] & 0x0F];
    }
    return hexText;
}

bool HexToBytes(const std::string& hexText, std::uint8_t* output, std::size_t size)
{
    if ((size * 2) != hexText.size())
    {
        return false;
    }

    std::vector<std::uint8_t> decoded(size);
    for (std::size_t index = 0; index < size; ++index)
    {
        const int high = HexValue(hexText[2 * index]);
        const int low = HexValue(hexText[2 * index + 1]);
        if ((0 > high) || (0 > low))
        {
            return false;
        }
        decoded[index] = static_cast<std::uint8_t>((high << 4) | low);
    }

    for (std::size_t index = 0; index < size; ++index)
    {
        output[index] = decoded[index];
    }
    return true;
}
