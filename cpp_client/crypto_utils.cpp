#include "crypto_utils.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

std::string HmacSha256(const std::string& key, const std::string& msg) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.length()),
             reinterpret_cast<const unsigned char*>(msg.data()), msg.length(),
             hash, &hash_len) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return std::string(reinterpret_cast<char*>(hash), hash_len);
}

std::string HexEncode(const unsigned char* data, size_t len) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string HexEncode(const std::string& data) {
    return HexEncode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string Sha256Hex(const std::string& str) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(str.data()), str.length(), hash);
    return HexEncode(hash, SHA256_DIGEST_LENGTH);
}

std::string Md5Digest(const char* data, size_t len) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data, len, digest, &digest_len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 computation failed");
    }
    return std::string(reinterpret_cast<char*>(digest), digest_len);
}

std::string Base64Encode(const std::string& data) {
    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL terminator.
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("Base64 encoding failed");
    }
    return std::string(reinterpret_cast<char*>(out.data()), static_cast<size_t>(written));
}
