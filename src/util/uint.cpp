// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "util/uint.hpp"
#include "util/strencodings.hpp"
#include <algorithm>
#include <stdexcept>

namespace lunachain {

template <unsigned int BITS>
base_blob<BITS>::base_blob(const std::vector<unsigned char> &vch) {
  if (vch.size() != WIDTH) {
    throw std::invalid_argument("base_blob: expected " + std::to_string(WIDTH) +
                                " bytes, got " + std::to_string(vch.size()));
  }
  std::copy(vch.begin(), vch.end(), m_data.begin());
}

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  return util::HexStr(m_data.data(), m_data.size());
}

template <unsigned int BITS> bool base_blob<BITS>::SetHex(std::string_view str) {
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  if (str.size() != static_cast<size_t>(WIDTH) * 2) {
    return false;
  }
  auto bytes = util::TryParseHex(str);
  if (!bytes) {
    return false;
  }
  std::copy(bytes->begin(), bytes->end(), m_data.begin());
  return true;
}

template class base_blob<160>;
template class base_blob<256>;

const uint256 uint256::ZERO{};

uint256 uint256S(std::string_view str) {
  uint256 out;
  if (!out.SetHex(str)) {
    out.SetNull();
  }
  return out;
}

} // namespace lunachain
