// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "util/strencodings.hpp"
#include <cctype>

namespace lunachain {
namespace util {

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::string HexStr(const uint8_t *data, size_t len) {
  static constexpr char kHexChars[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(kHexChars[data[i] >> 4]);
    out.push_back(kHexChars[data[i] & 0x0f]);
  }
  return out;
}

std::string HexStr(const std::vector<uint8_t> &data) {
  return HexStr(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> TryParseHex(std::string_view str) {
  if (str.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    int hi = HexDigit(str[i]);
    int lo = HexDigit(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

bool IsHex(std::string_view str) {
  if (str.empty() || str.size() % 2 != 0) {
    return false;
  }
  for (char c : str) {
    if (HexDigit(c) < 0)
      return false;
  }
  return true;
}

std::string ToLower(std::string_view str) {
  std::string out(str);
  for (char &c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string TrimQuotes(std::string_view str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1])))
    --end;
  if (end - begin >= 2) {
    char first = str[begin];
    char last = str[end - 1];
    if ((first == '"' || first == '\'') && first == last) {
      ++begin;
      --end;
    }
  }
  return std::string(str.substr(begin, end - begin));
}

} // namespace util
} // namespace lunachain
