#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace tokenvest {

// Ed25519 key that signs journal entries, hex encoded.
struct SignerKeyPair {
  std::string public_key;
  std::string private_key;
  std::string key_id;
};

class CryptoEngine {
public:
  Result initialize(std::string_view data_dir, std::string_view passphrase);

  [[nodiscard]] bool ready() const { return ready_; }
  [[nodiscard]] const SignerKeyPair& identity() const { return identity_; }

  [[nodiscard]] std::string hash_bytes(std::string_view payload) const;
  [[nodiscard]] std::string content_id(std::string_view payload) const;

  [[nodiscard]] std::string sign(std::string_view payload) const;
  [[nodiscard]] bool verify(std::string_view payload, std::string_view signature,
                            std::string_view public_key) const;

  Result lock();
  [[nodiscard]] std::string vault_path() const;
  [[nodiscard]] std::int64_t last_unlocked_unix() const { return last_unlocked_unix_; }

private:
  Result persist_vault(std::string_view passphrase);
  Result unlock_from_vault(std::string_view passphrase);
  Result generate_identity();

  std::string data_dir_;
  SignerKeyPair identity_;
  bool ready_ = false;
  std::int64_t last_unlocked_unix_ = 0;
};

}  // namespace tokenvest
