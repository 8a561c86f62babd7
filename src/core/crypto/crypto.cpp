#include "core/crypto/crypto.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>

#include <sodium.h>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace tokenvest {
namespace {

constexpr std::string_view kVaultFileName = "signer.vault";
constexpr std::string_view kVaultFormat = "tokenvest-vault-v1";

using SaltBytes = std::array<unsigned char, crypto_pwhash_SALTBYTES>;
using SecretKey = std::array<unsigned char, crypto_secretbox_KEYBYTES>;

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return {};
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool write_file(const std::filesystem::path& path, std::string_view data) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }

  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  return static_cast<bool>(out);
}

std::unordered_map<std::string, std::string> parse_key_values(std::string_view text) {
  std::unordered_map<std::string, std::string> values;

  std::istringstream in(std::string{text});
  std::string line;
  while (std::getline(in, line)) {
    const auto split = line.find('=');
    if (split == std::string::npos) {
      continue;
    }

    values[line.substr(0, split)] = line.substr(split + 1U);
  }

  return values;
}

SignerKeyPair parse_identity(std::string_view plain) {
  SignerKeyPair key_pair;
  const auto values = parse_key_values(plain);

  if (values.contains("public_key")) {
    key_pair.public_key = values.at("public_key");
  }
  if (values.contains("private_key")) {
    key_pair.private_key = values.at("private_key");
  }
  if (values.contains("key_id")) {
    key_pair.key_id = values.at("key_id");
  }

  return key_pair;
}

std::string serialize_identity(const SignerKeyPair& key_pair) {
  std::ostringstream out;
  out << "public_key=" << key_pair.public_key << "\n";
  out << "private_key=" << key_pair.private_key << "\n";
  out << "key_id=" << key_pair.key_id << "\n";
  return out.str();
}

bool derive_argon2id_key(std::string_view passphrase, const SaltBytes& salt, SecretKey& out_key) {
  return crypto_pwhash(out_key.data(), out_key.size(), passphrase.data(),
                       static_cast<unsigned long long>(passphrase.size()), salt.data(),
                       crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE,
                       crypto_pwhash_ALG_ARGON2ID13) == 0;
}

}  // namespace

Result CryptoEngine::initialize(std::string_view data_dir, std::string_view passphrase) {
  data_dir_ = std::string{data_dir};
  ready_ = false;

  if (passphrase.empty()) {
    return Result::failure(ErrorKind::InvalidConfig,
                           "Passphrase is required to unlock the signer vault.");
  }

  if (!util::sodium_ready()) {
    return Result::failure("libsodium initialization failed.");
  }

  std::error_code ec;
  const std::filesystem::path root{data_dir_};
  std::filesystem::create_directories(root, ec);
  if (ec) {
    return Result::failure(ErrorKind::StorageFailed, "Failed to create data directory: " + ec.message());
  }

  if (std::filesystem::exists(root / std::string{kVaultFileName})) {
    return unlock_from_vault(passphrase);
  }

  const Result identity_result = generate_identity();
  if (!identity_result.ok) {
    return identity_result;
  }

  const Result persist_result = persist_vault(passphrase);
  if (!persist_result.ok) {
    return persist_result;
  }

  ready_ = true;
  last_unlocked_unix_ = util::unix_timestamp_now();
  return Result::success("Signer vault created.", identity_.key_id);
}

Result CryptoEngine::unlock_from_vault(std::string_view passphrase) {
  const std::string vault_text = read_file(vault_path());
  if (vault_text.empty()) {
    return Result::failure(ErrorKind::StorageFailed, "Signer vault exists but is empty.");
  }

  const auto values = parse_key_values(vault_text);
  if (!values.contains("format") || values.at("format") != kVaultFormat || !values.contains("salt") ||
      !values.contains("nonce") || !values.contains("cipher")) {
    return Result::failure(ErrorKind::StorageFailed, "Signer vault format is not recognized.");
  }

  const std::string salt_bytes = util::from_hex(values.at("salt"));
  const std::string nonce = util::from_hex(values.at("nonce"));
  const std::string cipher = util::from_hex(values.at("cipher"));
  if (salt_bytes.size() != crypto_pwhash_SALTBYTES || nonce.size() != crypto_secretbox_NONCEBYTES ||
      cipher.size() < crypto_secretbox_MACBYTES) {
    return Result::failure(ErrorKind::StorageFailed, "Signer vault format is invalid.");
  }

  SaltBytes salt{};
  std::copy(salt_bytes.begin(), salt_bytes.end(), salt.begin());

  SecretKey key{};
  if (!derive_argon2id_key(passphrase, salt, key)) {
    return Result::failure("Failed to derive signer vault key (Argon2id).");
  }

  std::string plain(cipher.size() - crypto_secretbox_MACBYTES, '\0');
  const int opened = crypto_secretbox_open_easy(
      reinterpret_cast<unsigned char*>(plain.data()), reinterpret_cast<const unsigned char*>(cipher.data()),
      static_cast<unsigned long long>(cipher.size()), reinterpret_cast<const unsigned char*>(nonce.data()),
      key.data());
  sodium_memzero(key.data(), key.size());
  if (opened != 0) {
    return Result::failure(ErrorKind::InvalidConfig,
                           "Signer vault could not be decrypted. Wrong passphrase or corrupt file.");
  }

  identity_ = parse_identity(plain);
  sodium_memzero(plain.data(), plain.size());
  if (util::from_hex(identity_.private_key).size() != crypto_sign_SECRETKEYBYTES ||
      util::from_hex(identity_.public_key).size() != crypto_sign_PUBLICKEYBYTES || identity_.key_id.empty()) {
    identity_ = {};
    return Result::failure(ErrorKind::StorageFailed, "Signer vault payload could not be parsed.");
  }

  ready_ = true;
  last_unlocked_unix_ = util::unix_timestamp_now();
  return Result::success("Signer vault unlocked.", identity_.key_id);
}

Result CryptoEngine::persist_vault(std::string_view passphrase) {
  if (data_dir_.empty()) {
    return Result::failure(ErrorKind::InvalidConfig, "Signer vault persistence failed: data_dir is not configured.");
  }

  const std::string plain = serialize_identity(identity_);

  SaltBytes salt{};
  randombytes_buf(salt.data(), salt.size());

  SecretKey key{};
  if (!derive_argon2id_key(passphrase, salt, key)) {
    return Result::failure("Failed to derive signer vault key (Argon2id).");
  }

  std::array<unsigned char, crypto_secretbox_NONCEBYTES> nonce{};
  randombytes_buf(nonce.data(), nonce.size());

  std::string cipher(plain.size() + crypto_secretbox_MACBYTES, '\0');
  crypto_secretbox_easy(reinterpret_cast<unsigned char*>(cipher.data()),
                        reinterpret_cast<const unsigned char*>(plain.data()),
                        static_cast<unsigned long long>(plain.size()), nonce.data(), key.data());
  sodium_memzero(key.data(), key.size());

  std::ostringstream out;
  out << "format=" << kVaultFormat << "\n";
  out << "key_id=" << identity_.key_id << "\n";
  out << "public_key=" << identity_.public_key << "\n";
  out << "salt=" << util::to_hex(std::string_view{reinterpret_cast<const char*>(salt.data()), salt.size()})
      << "\n";
  out << "nonce=" << util::to_hex(std::string_view{reinterpret_cast<const char*>(nonce.data()), nonce.size()})
      << "\n";
  out << "cipher=" << util::to_hex(cipher) << "\n";

  if (!write_file(vault_path(), out.str())) {
    return Result::failure(ErrorKind::StorageFailed, "Failed to write signer vault.");
  }

  std::error_code ec;
  std::filesystem::permissions(vault_path(), std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  return Result::success("Signer vault persisted.");
}

Result CryptoEngine::generate_identity() {
  std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> public_key{};
  std::array<unsigned char, crypto_sign_SECRETKEYBYTES> private_key{};
  if (crypto_sign_keypair(public_key.data(), private_key.data()) != 0) {
    return Result::failure("Ed25519 keypair generation failed.");
  }

  identity_.public_key =
      util::to_hex(std::string_view{reinterpret_cast<const char*>(public_key.data()), public_key.size()});
  identity_.private_key =
      util::to_hex(std::string_view{reinterpret_cast<const char*>(private_key.data()), private_key.size()});
  sodium_memzero(private_key.data(), private_key.size());
  identity_.key_id = "key-" + hash_bytes(identity_.public_key).substr(0, 20);
  return Result::success("Generated signer identity.");
}

Result CryptoEngine::lock() {
  if (!ready_) {
    return Result::success("Signer already locked.");
  }
  sodium_memzero(identity_.private_key.data(), identity_.private_key.size());
  identity_.private_key.clear();
  ready_ = false;
  return Result::success("Signer locked.");
}

std::string CryptoEngine::vault_path() const {
  if (data_dir_.empty()) {
    return {};
  }
  return (std::filesystem::path{data_dir_} / std::string{kVaultFileName}).string();
}

std::string CryptoEngine::hash_bytes(std::string_view payload) const {
  return util::blake2b_hex(payload);
}

std::string CryptoEngine::content_id(std::string_view payload) const {
  return util::event_id_for_payload(payload);
}

std::string CryptoEngine::sign(std::string_view payload) const {
  if (!ready_) {
    return {};
  }

  const std::string private_key = util::from_hex(identity_.private_key);
  if (private_key.size() != crypto_sign_SECRETKEYBYTES) {
    return {};
  }

  std::array<unsigned char, crypto_sign_BYTES> signature{};
  crypto_sign_detached(signature.data(), nullptr, reinterpret_cast<const unsigned char*>(payload.data()),
                       static_cast<unsigned long long>(payload.size()),
                       reinterpret_cast<const unsigned char*>(private_key.data()));
  return util::to_hex(std::string_view{reinterpret_cast<const char*>(signature.data()), signature.size()});
}

bool CryptoEngine::verify(std::string_view payload, std::string_view signature,
                          std::string_view public_key) const {
  const std::string sig_bytes = util::from_hex(signature);
  const std::string public_key_bytes = util::from_hex(public_key);

  if (sig_bytes.size() != crypto_sign_BYTES || public_key_bytes.size() != crypto_sign_PUBLICKEYBYTES) {
    return false;
  }

  return crypto_sign_verify_detached(reinterpret_cast<const unsigned char*>(sig_bytes.data()),
                                     reinterpret_cast<const unsigned char*>(payload.data()),
                                     static_cast<unsigned long long>(payload.size()),
                                     reinterpret_cast<const unsigned char*>(public_key_bytes.data())) == 0;
}

}  // namespace tokenvest
