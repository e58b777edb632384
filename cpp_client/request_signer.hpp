#ifndef REQUEST_SIGNER_HPP
#define REQUEST_SIGNER_HPP

#include <chrono>
#include <map>
#include <string>

struct Credentials {
    std::string access_key;
    std::string secret_key;
    std::string region = "us-east-1";
    std::string service = "s3";
};

// AWS Signature Version 4 for header-authenticated requests and presigned URLs.
// Paths passed in must already be URI-encoded (S3 paths are not double-encoded).
class RequestSigner {
public:
    using HeaderMap = std::map<std::string, std::string>;
    using QueryMap = std::map<std::string, std::string>;
    using TimePoint = std::chrono::system_clock::time_point;

    static constexpr const char* kAlgorithm = "AWS4-HMAC-SHA256";
    static constexpr const char* kUnsignedPayload = "UNSIGNED-PAYLOAD";
    static constexpr long kMaxPresignExpirySeconds = 7L * 24 * 60 * 60;

    // Returns `headers` plus x-amz-date, x-amz-content-sha256 and Authorization.
    // Every header in `headers` (which must include Host) is signed.
    HeaderMap Sign(const std::string& method, const std::string& path, const QueryMap& query,
                   const HeaderMap& headers, const Credentials& credential, TimePoint now,
                   const std::string& payload_hash = kUnsignedPayload) const;

    HeaderMap Sign(const std::string& method, const std::string& path, const QueryMap& query,
                   const HeaderMap& headers, const Credentials& credential) const;

    // Builds "scheme://host/path?X-Amz-...&X-Amz-Signature=..." valid for `expiry`.
    std::string Presign(const std::string& method, const std::string& scheme, const std::string& host,
                        const std::string& path, const Credentials& credential,
                        std::chrono::seconds expiry, TimePoint now) const;

    std::string Presign(const std::string& method, const std::string& scheme, const std::string& host,
                        const std::string& path, const Credentials& credential,
                        std::chrono::seconds expiry) const;

    static std::string UriEncode(const std::string& value, bool encode_slash);
    static std::string CanonicalQueryString(const QueryMap& query);
    static std::string CanonicalRequest(const std::string& method, const std::string& path,
                                        const QueryMap& query, const HeaderMap& headers,
                                        const std::string& payload_hash, std::string* signed_headers);
    static std::string DeriveSigningKey(const Credentials& credential, const std::string& date_stamp);
    static std::string FormatAmzDate(TimePoint time);
    static std::string FormatDateStamp(TimePoint time);

private:
    static void ValidateCredential(const Credentials& credential);
    static std::string CredentialScope(const Credentials& credential, const std::string& date_stamp);
    static std::string Signature(const Credentials& credential, const std::string& date_stamp,
                                 const std::string& amz_date, const std::string& canonical_request);
};

#endif // REQUEST_SIGNER_HPP
