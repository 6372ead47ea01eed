// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_UTIL_SERIALIZE_HPP
#define LUNACHAIN_UTIL_SERIALIZE_HPP

#include "util/uint.hpp"
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <type_traits>
#include <vector>

namespace lunachain {

// Upper bound on any length prefix read from the wire
static constexpr uint64_t MAX_SERIALIZED_SIZE = 0x02000000;

/**
 * Binary stream for the wire format of blocks and transactions.
 *
 * Integers are little-endian, lengths are Bitcoin-style CompactSize,
 * strings and byte vectors are length-prefixed, hashes are written as their
 * 32 raw bytes. Reads past the end or oversized length prefixes throw
 * std::ios_base::failure; callers at the input boundary catch it.
 */
class DataStream {
public:
  DataStream() = default;
  explicit DataStream(std::vector<uint8_t> data) : data_(std::move(data)) {}

  template <typename T> void WriteInt(T value) {
    static_assert(std::is_integral_v<T>);
    using U = std::make_unsigned_t<T>;
    U v = static_cast<U>(value);
    for (size_t i = 0; i < sizeof(T); ++i) {
      data_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
  }

  template <typename T> T ReadInt() {
    static_assert(std::is_integral_v<T>);
    using U = std::make_unsigned_t<T>;
    Require(sizeof(T));
    U v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
      v |= static_cast<U>(static_cast<U>(data_[pos_ + i]) << (8 * i));
    }
    pos_ += sizeof(T);
    return static_cast<T>(v);
  }

  void WriteCompactSize(uint64_t n) {
    if (n < 253) {
      WriteInt<uint8_t>(static_cast<uint8_t>(n));
    } else if (n <= 0xffff) {
      WriteInt<uint8_t>(253);
      WriteInt<uint16_t>(static_cast<uint16_t>(n));
    } else if (n <= 0xffffffff) {
      WriteInt<uint8_t>(254);
      WriteInt<uint32_t>(static_cast<uint32_t>(n));
    } else {
      WriteInt<uint8_t>(255);
      WriteInt<uint64_t>(n);
    }
  }

  // Rejects non-canonical encodings and values above MAX_SERIALIZED_SIZE
  uint64_t ReadCompactSize() {
    uint8_t first = ReadInt<uint8_t>();
    uint64_t n = 0;
    if (first < 253) {
      n = first;
    } else if (first == 253) {
      n = ReadInt<uint16_t>();
      if (n < 253)
        throw std::ios_base::failure("non-canonical ReadCompactSize()");
    } else if (first == 254) {
      n = ReadInt<uint32_t>();
      if (n < 0x10000u)
        throw std::ios_base::failure("non-canonical ReadCompactSize()");
    } else {
      n = ReadInt<uint64_t>();
      if (n < 0x100000000ULL)
        throw std::ios_base::failure("non-canonical ReadCompactSize()");
    }
    if (n > MAX_SERIALIZED_SIZE)
      throw std::ios_base::failure("ReadCompactSize(): size too large");
    return n;
  }

  void WriteBytes(const uint8_t *p, size_t len) {
    data_.insert(data_.end(), p, p + len);
  }

  void WriteString(const std::string &s) {
    WriteCompactSize(s.size());
    WriteBytes(reinterpret_cast<const uint8_t *>(s.data()), s.size());
  }

  std::string ReadString() {
    uint64_t len = ReadCompactSize();
    Require(len);
    std::string s(reinterpret_cast<const char *>(data_.data() + pos_), len);
    pos_ += len;
    return s;
  }

  void WriteVector(const std::vector<uint8_t> &v) {
    WriteCompactSize(v.size());
    WriteBytes(v.data(), v.size());
  }

  std::vector<uint8_t> ReadVector() {
    uint64_t len = ReadCompactSize();
    Require(len);
    std::vector<uint8_t> v(data_.begin() + pos_, data_.begin() + pos_ + len);
    pos_ += len;
    return v;
  }

  void WriteHash(const uint256 &h) { WriteBytes(h.begin(), h.size()); }

  uint256 ReadHash() {
    Require(uint256::size());
    uint256 h;
    std::memcpy(h.begin(), data_.data() + pos_, uint256::size());
    pos_ += uint256::size();
    return h;
  }

  template <typename T> DataStream &operator<<(const T &obj) {
    obj.Serialize(*this);
    return *this;
  }

  template <typename T> DataStream &operator>>(T &obj) {
    obj.Unserialize(*this);
    return *this;
  }

  const std::vector<uint8_t> &data() const { return data_; }
  size_t size() const { return data_.size() - pos_; }
  bool empty() const { return size() == 0; }

private:
  void Require(uint64_t n) const {
    if (n > data_.size() - pos_) {
      throw std::ios_base::failure("DataStream::read(): end of data");
    }
  }

  std::vector<uint8_t> data_;
  size_t pos_{0};
};

// Serialized size of an object
template <typename T> size_t GetSerializeSize(const T &obj) {
  DataStream s;
  obj.Serialize(s);
  return s.data().size();
}

} // namespace lunachain

#endif // LUNACHAIN_UTIL_SERIALIZE_HPP
