#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <iomanip>
#include <random>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const char* data, std::size_t size){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data), size, out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data.data(), data.size()));
}

std::string sha256_hex(const std::vector<char> &data){
    return hex_from_bytes(sha256_bytes(data.data(), data.size()));
}

std::string base64_encode(const char* data, std::size_t size){
    if(size == 0) return "";
    // EVP_EncodeBlock takes an int length; chunks are far below that.
    if(size > static_cast<std::size_t>(INT_MAX / 4 * 3)) return "";
    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(data),
                                  static_cast<int>(size));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::optional<std::vector<char>> base64_decode(const std::string& encoded){
    if(encoded.empty()) return std::vector<char>{};
    if(encoded.size() % 4 != 0) return std::nullopt;
    if(encoded.size() > static_cast<std::size_t>(INT_MAX)) return std::nullopt;

    std::vector<char> out(encoded.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if(decoded < 0) return std::nullopt;

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t padding = 0;
    if(encoded[encoded.size() - 1] == '=') ++padding;
    if(encoded[encoded.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return out;
}

std::string random_hex_id(std::size_t byte_length){
    std::vector<unsigned char> buffer(byte_length);
    if(byte_length == 0) return "";
    if(RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1){
        static thread_local std::mt19937_64 rng(std::random_device{}());
        std::uniform_int_distribution<int> dist(0, 255);
        for(auto& b : buffer) b = static_cast<unsigned char>(dist(rng));
    }
    return hex_from_bytes(buffer);
}

std::string trim_copy(const std::string& value){
    auto begin = std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); });
    auto end = std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base();
    if(begin >= end) return "";
    return std::string(begin, end);
}

bool is_blank(const std::string& value){
    return std::all_of(value.begin(), value.end(), [](unsigned char ch){ return std::isspace(ch); });
}
