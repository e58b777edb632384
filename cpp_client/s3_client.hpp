#ifndef S3_CLIENT_HPP
#define S3_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"
#include "request_signer.hpp"
#include "s3_xml.hpp"
#include "transfer_state.hpp"
#include "transfer_transport.hpp"

struct ObjectMetadata {
    std::uint64_t size = 0;
    std::string etag; // unquoted
    std::string last_modified;
    std::string version_id;
    std::string content_type;
};

struct PresignedUrl {
    std::string url;
    std::string method;
    std::chrono::system_clock::time_point created;
    std::chrono::system_clock::time_point expires;
};

// Multipart-upload and ranged-download requests against a path-style S3 endpoint.
class S3Client {
public:
    S3Client(const Config::TransferConfig& config, TransferTransport& transport);

    // Content-Type and user metadata are signed and fixed for the lifetime of the object.
    InitiateMultipartUploadResult CreateMultipartUpload(const std::string& bucket, const std::string& key,
                                                        const UploadMetadata& metadata = {},
                                                        const CancellationToken* cancel = nullptr);

    // Returns the part ETag without quotes.
    std::string UploadPart(const std::string& bucket, const std::string& key, const std::string& upload_id,
                           int part_number, const std::string& data, const std::string& content_md5,
                           const ProgressCallback& on_bytes, const CancellationToken* cancel);

    // `parts` must already be sorted ascending by part number.
    CompleteMultipartUploadResult CompleteMultipartUpload(const std::string& bucket, const std::string& key,
                                                          const std::string& upload_id,
                                                          const std::vector<PartResult>& parts,
                                                          const CancellationToken* cancel = nullptr);

    void AbortMultipartUpload(const std::string& bucket, const std::string& key, const std::string& upload_id);

    ObjectMetadata HeadObject(const std::string& bucket, const std::string& key,
                              const CancellationToken* cancel = nullptr);

    // Inclusive byte range. A non-empty `if_match` makes a changed object fail with IntegrityError.
    std::string GetObjectRange(const std::string& bucket, const std::string& key, std::uint64_t start,
                               std::uint64_t end, const std::string& if_match, const ProgressCallback& on_bytes,
                               const CancellationToken* cancel);

    // GET, PUT, DELETE or HEAD.
    PresignedUrl PresignUrl(const std::string& method, const std::string& bucket, const std::string& key,
                            std::chrono::seconds expiry) const;

    static std::string ObjectPath(const std::string& bucket, const std::string& key);

private:
    HttpRequest NewRequest(const std::string& method, const std::string& bucket, const std::string& key,
                           const CancellationToken* cancel) const;
    void SignRequest(HttpRequest& request) const;

    TransferTransport& transport_;
    RequestSigner signer_;
    Credentials credentials_;
    std::string host_;
    std::string scheme_;
};

#endif // S3_CLIENT_HPP
