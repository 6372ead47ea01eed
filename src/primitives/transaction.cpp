// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "primitives/transaction.hpp"
#include "crypto/sha256.hpp"
#include <sstream>

namespace lunachain {

namespace {

void SerializeUnsigned(DataStream &s, const std::string &sender,
                       const std::string &recipient, CAmount amount, CAmount fee,
                       uint64_t nonce, int64_t timestamp,
                       const std::vector<uint8_t> &pubkey) {
  s.WriteString(sender);
  s.WriteString(recipient);
  s.WriteInt<int64_t>(amount);
  s.WriteInt<int64_t>(fee);
  s.WriteInt<uint64_t>(nonce);
  s.WriteInt<int64_t>(timestamp);
  s.WriteVector(pubkey);
}

} // namespace

uint256 CMutableTransaction::GetSignatureHash() const {
  DataStream s;
  SerializeUnsigned(s, sender, recipient, amount, fee, nonce, timestamp,
                    sender_pubkey);
  return crypto::SHA256d(s.data());
}

void CMutableTransaction::Serialize(DataStream &s) const {
  SerializeUnsigned(s, sender, recipient, amount, fee, nonce, timestamp,
                    sender_pubkey);
  s.WriteVector(signature);
}

void CMutableTransaction::Unserialize(DataStream &s) {
  sender = s.ReadString();
  recipient = s.ReadString();
  amount = s.ReadInt<int64_t>();
  fee = s.ReadInt<int64_t>();
  nonce = s.ReadInt<uint64_t>();
  timestamp = s.ReadInt<int64_t>();
  sender_pubkey = s.ReadVector();
  signature = s.ReadVector();
}

CTransaction::CTransaction(const CMutableTransaction &tx)
    : sender(tx.sender), recipient(tx.recipient), amount(tx.amount),
      fee(tx.fee), nonce(tx.nonce), timestamp(tx.timestamp),
      sender_pubkey(tx.sender_pubkey), signature(tx.signature),
      hash_(ComputeHash()), total_size_(GetSerializeSize(*this)) {}

CTransaction::CTransaction(CMutableTransaction &&tx)
    : sender(std::move(tx.sender)), recipient(std::move(tx.recipient)),
      amount(tx.amount), fee(tx.fee), nonce(tx.nonce),
      timestamp(tx.timestamp), sender_pubkey(std::move(tx.sender_pubkey)),
      signature(std::move(tx.signature)), hash_(ComputeHash()),
      total_size_(GetSerializeSize(*this)) {}

void CTransaction::Serialize(DataStream &s) const {
  SerializeUnsigned(s, sender, recipient, amount, fee, nonce, timestamp,
                    sender_pubkey);
  s.WriteVector(signature);
}

uint256 CTransaction::ComputeHash() const {
  DataStream s;
  Serialize(s);
  return crypto::SHA256d(s.data());
}

uint256 CTransaction::GetSignatureHash() const {
  DataStream s;
  SerializeUnsigned(s, sender, recipient, amount, fee, nonce, timestamp,
                    sender_pubkey);
  return crypto::SHA256d(s.data());
}

std::string CTransaction::ToString() const {
  std::stringstream s;
  s << "CTransaction(hash=" << hash_.ToString().substr(0, 16)
    << ", sender=" << sender << ", recipient=" << recipient
    << ", amount=" << amount << ", fee=" << fee << ", nonce=" << nonce
    << ", timestamp=" << timestamp << ")";
  return s.str();
}

CTransactionRef DeserializeTransaction(DataStream &s) {
  CMutableTransaction mtx;
  mtx.Unserialize(s);
  return MakeTransactionRef(std::move(mtx));
}

} // namespace lunachain
