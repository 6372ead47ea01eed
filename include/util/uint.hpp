// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_UTIL_UINT_HPP
#define LUNACHAIN_UTIL_UINT_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace lunachain {

/**
 * Fixed-size opaque blob of BITS bits.
 *
 * Bytes are stored in display order: data()[0] is the first byte of the hex
 * string and the most significant byte when the blob is read as a number
 * (see UintToArith256). Digests are stored exactly as the hash function
 * emits them, so lexicographic byte order equals hex string order.
 */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data{};

public:
  constexpr base_blob() = default;

  // Throws std::invalid_argument if vch.size() != WIDTH
  explicit base_blob(const std::vector<unsigned char> &vch);

  constexpr bool IsNull() const {
    for (uint8_t b : m_data) {
      if (b != 0)
        return false;
    }
    return true;
  }

  constexpr void SetNull() { m_data.fill(0); }

  int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  // Lowercase hex, WIDTH * 2 characters
  std::string GetHex() const;

  /**
   * Parse a hex string of exactly WIDTH * 2 digits (an optional "0x" prefix
   * is accepted). Leaves the blob unchanged and returns false otherwise.
   */
  bool SetHex(std::string_view str);

  std::string ToString() const { return GetHex(); }

  unsigned char *data() { return m_data.data(); }
  const unsigned char *data() const { return m_data.data(); }

  unsigned char *begin() { return m_data.data(); }
  unsigned char *end() { return m_data.data() + WIDTH; }
  const unsigned char *begin() const { return m_data.data(); }
  const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }
};

class uint160 : public base_blob<160> {
public:
  constexpr uint160() = default;
  explicit uint160(const std::vector<unsigned char> &vch) : base_blob<160>(vch) {}
};

class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  explicit uint256(const std::vector<unsigned char> &vch) : base_blob<256>(vch) {}
  static const uint256 ZERO;
};

// Parse hex into a uint256; invalid input yields the null hash
uint256 uint256S(std::string_view str);

} // namespace lunachain

#endif // LUNACHAIN_UTIL_UINT_HPP
