#ifndef CRYPTO_UTILS_HPP
#define CRYPTO_UTILS_HPP

#include <cstddef>
#include <string>

// Raw (binary) HMAC-SHA256 of msg keyed with key.
std::string HmacSha256(const std::string& key, const std::string& msg);

std::string HexEncode(const unsigned char* data, size_t len);
std::string HexEncode(const std::string& data);

// Lower-case hex SHA-256 of str.
std::string Sha256Hex(const std::string& str);

// Binary MD5 digest.
std::string Md5Digest(const char* data, size_t len);

std::string Base64Encode(const std::string& data);

#endif // CRYPTO_UTILS_HPP
