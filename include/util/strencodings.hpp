// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_UTIL_STRENCODINGS_HPP
#define LUNACHAIN_UTIL_STRENCODINGS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lunachain {
namespace util {

std::string HexStr(const uint8_t *data, size_t len);
std::string HexStr(const std::vector<uint8_t> &data);

// Returns nullopt on odd length or non-hex characters
std::optional<std::vector<uint8_t>> TryParseHex(std::string_view str);

bool IsHex(std::string_view str);

std::string ToLower(std::string_view str);

// Strip surrounding whitespace and one layer of matching quotes
std::string TrimQuotes(std::string_view str);

} // namespace util
} // namespace lunachain

#endif // LUNACHAIN_UTIL_STRENCODINGS_HPP
