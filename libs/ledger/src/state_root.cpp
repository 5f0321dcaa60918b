#include "payledger/ledger/state_root.hpp"

#include <sodium.h>

#include <stdexcept>
#include <string>

namespace payledger {
namespace ledger {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

void append_row(std::string& out, const AccountSnapshot& row) {
  out += std::to_string(row.client);
  out.push_back('|');
  out += row.available.to_string(kDisplayPrecision);
  out.push_back('|');
  out += row.held.to_string(kDisplayPrecision);
  out.push_back('|');
  out += row.total.to_string(kDisplayPrecision);
  out.push_back('|');
  out += row.locked ? "1" : "0";
  out.push_back('\n');
}

}  // namespace

StateRoot compute_state_root(std::span<const AccountSnapshot> rows) {
  ensure_sodium_init();

  crypto_generichash_state state;
  if (crypto_generichash_init(&state, nullptr, 0, kStateRootSize) != 0) {
    throw std::runtime_error("state root hash init failed");
  }

  std::string line;
  for (const auto& row : rows) {
    line.clear();
    append_row(line, row);
    if (crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(line.data()),
                                  line.size()) != 0) {
      throw std::runtime_error("state root hash update failed");
    }
  }

  StateRoot root{};
  if (crypto_generichash_final(&state, root.data(), root.size()) != 0) {
    throw std::runtime_error("state root hash finalize failed");
  }
  return root;
}

std::string to_hex(const StateRoot& root) {
  std::string hex(root.size() * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), root.data(), root.size());
  hex.pop_back();
  return hex;
}

}  // namespace ledger
}  // namespace payledger
