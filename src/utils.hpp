#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const char* data, std::size_t size);
std::string sha256_hex(const std::string &data);
std::string sha256_hex(const std::vector<char> &data);

std::string base64_encode(const char* data, std::size_t size);
// nullopt on malformed input (bad length, bad alphabet).
std::optional<std::vector<char>> base64_decode(const std::string& encoded);

// Hex string built from `byte_length` random bytes. Uses the OpenSSL CSPRNG and
// falls back to a seeded mt19937_64 if it is unavailable.
std::string random_hex_id(std::size_t byte_length);
inline std::string generate_room_id() { return random_hex_id(4); }
inline std::string generate_transfer_id() { return random_hex_id(16); }

std::string trim_copy(const std::string& value);
bool is_blank(const std::string& value);
