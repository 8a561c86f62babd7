#pragma once

#include <string>
#include <string_view>

namespace tokenvest::util {

// Runs sodium_init() once per process. Every libsodium call site goes through it.
bool sodium_ready();

std::string to_hex(std::string_view bytes);
std::string from_hex(std::string_view hex);

std::string sha256_hex(std::string_view payload);
std::string blake2b_hex(std::string_view payload);

// Journal event ids: "evt-" + BLAKE2b(payload).
std::string event_id_for_payload(std::string_view payload);

}  // namespace tokenvest::util
