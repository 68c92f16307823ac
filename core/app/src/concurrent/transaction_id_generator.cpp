#include "payflow/concurrent/transaction_id_generator.hpp"

#include <utility>

namespace payflow {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// Appends the low `nibbles` hex digits of value, most significant first.
void appendHex(std::string& out, std::uint64_t value, int nibbles) {
  for (int shift = (nibbles - 1) * 4; shift >= 0; shift -= 4) {
    out.push_back(kHexDigits[(value >> shift) & 0xF]);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: seed the engine once from the platform entropy source
// -----------------------------------------------------------------------------
TransactionIdGenerator::TransactionIdGenerator(std::string prefix)
    : prefix_(std::move(prefix)) {
  std::random_device rd;
  std::seed_seq seed{rd(), rd(), rd(), rd()};
  engine_.seed(seed);
}

// -----------------------------------------------------------------------------
// next_id: RFC 4122 version-4 layout, xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
// -----------------------------------------------------------------------------
domain::TransactionId TransactionIdGenerator::next_id() {
  std::uint64_t hi;
  std::uint64_t lo;
  {
    std::lock_guard lock(mutex_);
    hi = engine_();
    lo = engine_();
  }

  // Version nibble = 4, variant bits = 10xx.
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::string id;
  id.reserve(prefix_.size() + 37);
  if (!prefix_.empty()) {
    id += prefix_;
    id.push_back('-');
  }

  appendHex(id, hi >> 32, 8);
  id.push_back('-');
  appendHex(id, hi >> 16, 4);
  id.push_back('-');
  appendHex(id, hi, 4);
  id.push_back('-');
  appendHex(id, lo >> 48, 4);
  id.push_back('-');
  appendHex(id, lo, 12);

  return id;
}

}  // namespace payflow
