#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief Render bytes as lower-case hex.
 *
 * @param[in] data Bytes to render
 * @param[in] size Number of bytes
 * @return Hex text of length 2 * size
 */
std::string BytesToHex(const std::uint8_t* data, std::size_t size);

/**
 * @brief Parse hex text (either case) of exactly 2 * size characters.
 *
 * @param[in] hexText Hex text
 * @param[out] output Destination of size bytes, untouched on failure
 * @param[in] size Expected number of bytes
 * @return false on wrong length or non-hex characters
 */
bool HexToBytes(const std::string& hexText, std::uint8_t* output, std::size_t size);
