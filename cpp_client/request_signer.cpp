#include "request_signer.hpp"
#include "crypto_utils.hpp"
#include "transfer_errors.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>

namespace {
std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Trims surrounding whitespace and collapses inner runs of spaces to one.
std::string CanonicalHeaderValue(const std::string& value) {
    std::string result;
    bool in_space = false;
    for (char c : value) {
        if (c == ' ' || c == '\t') {
            in_space = true;
            continue;
        }
        if (in_space && !result.empty()) {
            result.push_back(' ');
        }
        in_space = false;
        result.push_back(c);
    }
    return result;
}

std::string FormatUtc(std::chrono::system_clock::time_point time, const char* format) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), format, &tm_utc);
    return buffer;
}
} // namespace

std::string RequestSigner::UriEncode(const std::string& value, bool encode_slash) {
    static const char* kHex = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else if (c == '/' && !encode_slash) {
            encoded.push_back('/');
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[c >> 4]);
            encoded.push_back(kHex[c & 0x0F]);
        }
    }
    return encoded;
}

std::string RequestSigner::CanonicalQueryString(const QueryMap& query) {
    // Sort by encoded key; std::map orders raw keys, which can differ once encoded.
    std::map<std::string, std::string> encoded;
    for (const auto& param : query) {
        encoded[UriEncode(param.first, true)] = UriEncode(param.second, true);
    }

    std::string result;
    for (const auto& param : encoded) {
        if (!result.empty()) result.push_back('&');
        result += param.first + "=" + param.second;
    }
    return result;
}

std::string RequestSigner::CanonicalRequest(const std::string& method, const std::string& path,
                                            const QueryMap& query, const HeaderMap& headers,
                                            const std::string& payload_hash, std::string* signed_headers) {
    std::map<std::string, std::string> canonical_headers;
    for (const auto& header : headers) {
        std::string name = ToLower(header.first);
        std::string value = CanonicalHeaderValue(header.second);
        auto it = canonical_headers.find(name);
        if (it == canonical_headers.end()) {
            canonical_headers.emplace(name, value);
        } else {
            it->second += "," + value;
        }
    }

    std::stringstream header_block;
    std::string signed_list;
    for (const auto& header : canonical_headers) {
        header_block << header.first << ":" << header.second << "\n";
        if (!signed_list.empty()) signed_list.push_back(';');
        signed_list += header.first;
    }

    if (signed_headers) {
        *signed_headers = signed_list;
    }

    std::stringstream canonical_req;
    canonical_req << method << "\n"
                  << (path.empty() ? "/" : path) << "\n"
                  << CanonicalQueryString(query) << "\n"
                  << header_block.str() << "\n"
                  << signed_list << "\n"
                  << payload_hash;
    return canonical_req.str();
}

std::string RequestSigner::DeriveSigningKey(const Credentials& credential, const std::string& date_stamp) {
    std::string k_date = HmacSha256("AWS4" + credential.secret_key, date_stamp);
    std::string k_region = HmacSha256(k_date, credential.region);
    std::string k_service = HmacSha256(k_region, credential.service);
    return HmacSha256(k_service, "aws4_request");
}

std::string RequestSigner::FormatAmzDate(TimePoint time) {
    return FormatUtc(time, "%Y%m%dT%H%M%SZ");
}

std::string RequestSigner::FormatDateStamp(TimePoint time) {
    return FormatUtc(time, "%Y%m%d");
}

void RequestSigner::ValidateCredential(const Credentials& credential) {
    if (credential.access_key.empty()) throw ValidationError("access key must not be empty");
    if (credential.secret_key.empty()) throw ValidationError("secret key must not be empty");
    if (credential.region.empty()) throw ValidationError("region must not be empty");
    if (credential.service.empty()) throw ValidationError("service must not be empty");
}

std::string RequestSigner::CredentialScope(const Credentials& credential, const std::string& date_stamp) {
    return date_stamp + "/" + credential.region + "/" + credential.service + "/aws4_request";
}

std::string RequestSigner::Signature(const Credentials& credential, const std::string& date_stamp,
                                     const std::string& amz_date, const std::string& canonical_request) {
    std::stringstream string_to_sign;
    string_to_sign << kAlgorithm << "\n"
                   << amz_date << "\n"
                   << CredentialScope(credential, date_stamp) << "\n"
                   << Sha256Hex(canonical_request);

    std::string signing_key = DeriveSigningKey(credential, date_stamp);
    return HexEncode(HmacSha256(signing_key, string_to_sign.str()));
}

RequestSigner::HeaderMap RequestSigner::Sign(const std::string& method, const std::string& path,
                                             const QueryMap& query, const HeaderMap& headers,
                                             const Credentials& credential, TimePoint now,
                                             const std::string& payload_hash) const {
    ValidateCredential(credential);
    if (method.empty()) throw ValidationError("HTTP method must not be empty");

    bool has_host = std::any_of(headers.begin(), headers.end(),
                                [](const HeaderMap::value_type& h) { return ToLower(h.first) == "host"; });
    if (!has_host) throw ValidationError("Host header is required for signing");

    std::string amz_date = FormatAmzDate(now);
    std::string date_stamp = FormatDateStamp(now);

    HeaderMap signed_set = headers;
    signed_set["x-amz-date"] = amz_date;
    signed_set["x-amz-content-sha256"] = payload_hash;

    std::string signed_headers;
    std::string canonical = CanonicalRequest(method, path, query, signed_set, payload_hash, &signed_headers);
    std::string signature = Signature(credential, date_stamp, amz_date, canonical);

    std::stringstream auth_header;
    auth_header << kAlgorithm << " Credential=" << credential.access_key << "/"
                << CredentialScope(credential, date_stamp)
                << ", SignedHeaders=" << signed_headers << ", Signature=" << signature;

    signed_set["Authorization"] = auth_header.str();
    return signed_set;
}

RequestSigner::HeaderMap RequestSigner::Sign(const std::string& method, const std::string& path,
                                             const QueryMap& query, const HeaderMap& headers,
                                             const Credentials& credential) const {
    return Sign(method, path, query, headers, credential, std::chrono::system_clock::now());
}

std::string RequestSigner::Presign(const std::string& method, const std::string& scheme,
                                   const std::string& host, const std::string& path,
                                   const Credentials& credential, std::chrono::seconds expiry,
                                   TimePoint now) const {
    ValidateCredential(credential);
    if (expiry.count() < 1) {
        throw ValidationError("Presigned URL expiry must be at least 1 second");
    }
    if (expiry.count() > kMaxPresignExpirySeconds) {
        throw ValidationError("Presigned URL expiry cannot exceed 7 days");
    }
    if (host.empty()) throw ValidationError("host must not be empty");
    if (path.empty() || path == "/") throw ValidationError("object path must not be empty");

    std::string amz_date = FormatAmzDate(now);
    std::string date_stamp = FormatDateStamp(now);

    QueryMap query;
    query["X-Amz-Algorithm"] = kAlgorithm;
    query["X-Amz-Credential"] = credential.access_key + "/" + CredentialScope(credential, date_stamp);
    query["X-Amz-Date"] = amz_date;
    query["X-Amz-Expires"] = std::to_string(expiry.count());
    query["X-Amz-SignedHeaders"] = "host";

    HeaderMap headers{{"host", host}};
    std::string canonical = CanonicalRequest(method, path, query, headers, kUnsignedPayload, nullptr);
    std::string signature = Signature(credential, date_stamp, amz_date, canonical);

    return scheme + "://" + host + path + "?" + CanonicalQueryString(query) +
           "&X-Amz-Signature=" + signature;
}

std::string RequestSigner::Presign(const std::string& method, const std::string& scheme,
                                   const std::string& host, const std::string& path,
                                   const Credentials& credential, std::chrono::seconds expiry) const {
    return Presign(method, scheme, host, path, credential, expiry, std::chrono::system_clock::now());
}
