#include "s3_client.hpp"
#include "logger.hpp"
#include "transfer_errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>

namespace {
void ValidateObject(const std::string& bucket, const std::string& key) {
    if (bucket.empty()) throw ValidationError("bucket name must not be empty");
    if (key.empty()) throw ValidationError("object key must not be empty");
}

bool IsTokenChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
}

bool HasLineBreak(const std::string& value) {
    return value.find_first_of("\r\n") != std::string::npos;
}

void ValidateMetadata(const UploadMetadata& metadata) {
    if (HasLineBreak(metadata.content_type)) {
        throw ValidationError("Content-Type must not contain line breaks");
    }
    for (const auto& entry : metadata.user) {
        if (entry.first.empty() || !std::all_of(entry.first.begin(), entry.first.end(), IsTokenChar)) {
            throw ValidationError("invalid metadata name '" + entry.first + "'");
        }
        if (HasLineBreak(entry.second)) {
            throw ValidationError("metadata value for '" + entry.first + "' must not contain line breaks");
        }
    }
}

void ValidateUploadId(const std::string& upload_id) {
    if (upload_id.empty()) throw ValidationError("upload id must not be empty");
}
} // namespace

S3Client::S3Client(const Config::TransferConfig& config, TransferTransport& transport)
    : transport_(transport), host_(config.endpoint), scheme_(config.use_ssl ? "https" : "http") {
    credentials_.access_key = config.access_key;
    credentials_.secret_key = config.secret_key;
    credentials_.region = config.region;
}

std::string S3Client::ObjectPath(const std::string& bucket, const std::string& key) {
    return "/" + RequestSigner::UriEncode(bucket, true) + "/" + RequestSigner::UriEncode(key, false);
}

HttpRequest S3Client::NewRequest(const std::string& method, const std::string& bucket, const std::string& key,
                                 const CancellationToken* cancel) const {
    HttpRequest request;
    request.method = method;
    request.path = ObjectPath(bucket, key);
    request.headers["Host"] = host_;
    request.cancel = cancel;
    return request;
}

void S3Client::SignRequest(HttpRequest& request) const {
    request.headers = signer_.Sign(request.method, request.path, request.query, request.headers, credentials_);
}

InitiateMultipartUploadResult S3Client::CreateMultipartUpload(const std::string& bucket, const std::string& key,
                                                              const UploadMetadata& metadata,
                                                              const CancellationToken* cancel) {
    ValidateObject(bucket, key);
    ValidateMetadata(metadata);

    HttpRequest request = NewRequest("POST", bucket, key, cancel);
    request.query["uploads"] = "";
    if (!metadata.content_type.empty()) {
        request.headers["Content-Type"] = metadata.content_type;
    }
    for (const auto& entry : metadata.user) {
        std::string name = entry.first;
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        request.headers["x-amz-meta-" + name] = entry.second;
    }
    SignRequest(request);

    HttpResponse response = transport_.Execute(request);
    InitiateMultipartUploadResult result = ParseInitiateMultipartUpload(response.body);
    Logger::Info("Initiated multipart upload " + result.upload_id + " for " + bucket + "/" + key, "S3Client");
    return result;
}

std::string S3Client::UploadPart(const std::string& bucket, const std::string& key, const std::string& upload_id,
                                 int part_number, const std::string& data, const std::string& content_md5,
                                 const ProgressCallback& on_bytes, const CancellationToken* cancel) {
    ValidateObject(bucket, key);
    ValidateUploadId(upload_id);
    if (part_number < 1 || part_number > 10000) {
        throw ValidationError("part number out of range: " + std::to_string(part_number));
    }

    HttpRequest request = NewRequest("PUT", bucket, key, cancel);
    request.query["partNumber"] = std::to_string(part_number);
    request.query["uploadId"] = upload_id;
    if (!content_md5.empty()) {
        request.headers["Content-MD5"] = content_md5;
    }
    SignRequest(request);

    size_t offset = 0;
    BodyReader reader = [&data, &offset](char* buffer, size_t max) {
        size_t n = std::min(max, data.size() - offset);
        std::memcpy(buffer, data.data() + offset, n);
        offset += n;
        return n;
    };

    HttpResponse response = transport_.UploadBody(request, reader, data.size(), on_bytes);
    std::string etag = TrimETag(response.Header("etag"));
    if (etag.empty()) {
        throw ProtocolError("UploadPart " + std::to_string(part_number) + " response has no ETag",
                            response.status_code);
    }
    return etag;
}

CompleteMultipartUploadResult S3Client::CompleteMultipartUpload(const std::string& bucket, const std::string& key,
                                                                const std::string& upload_id,
                                                                const std::vector<PartResult>& parts,
                                                                const CancellationToken* cancel) {
    ValidateObject(bucket, key);
    ValidateUploadId(upload_id);

    HttpRequest request = NewRequest("POST", bucket, key, cancel);
    request.query["uploadId"] = upload_id;
    request.body = BuildCompleteMultipartUploadXml(parts);
    request.headers["Content-Type"] = "application/xml";
    SignRequest(request);

    HttpResponse response = transport_.Execute(request);
    CompleteMultipartUploadResult result = ParseCompleteMultipartUpload(response.body);
    Logger::Info("Completed multipart upload " + upload_id + " with " + std::to_string(parts.size()) + " parts",
                 "S3Client");
    return result;
}

void S3Client::AbortMultipartUpload(const std::string& bucket, const std::string& key,
                                    const std::string& upload_id) {
    ValidateObject(bucket, key);
    ValidateUploadId(upload_id);

    HttpRequest request = NewRequest("DELETE", bucket, key, nullptr);
    request.query["uploadId"] = upload_id;
    SignRequest(request);

    transport_.Execute(request);
    Logger::Info("Aborted multipart upload " + upload_id, "S3Client");
}

ObjectMetadata S3Client::HeadObject(const std::string& bucket, const std::string& key,
                                    const CancellationToken* cancel) {
    ValidateObject(bucket, key);

    HttpRequest request = NewRequest("HEAD", bucket, key, cancel);
    SignRequest(request);

    HttpResponse response = transport_.Execute(request);

    ObjectMetadata metadata;
    std::string length = response.Header("content-length");
    if (length.empty()) {
        throw ProtocolError("HEAD " + bucket + "/" + key + " returned no Content-Length", response.status_code);
    }
    try {
        metadata.size = std::stoull(length);
    } catch (const std::exception&) {
        throw ProtocolError("HEAD " + bucket + "/" + key + " returned invalid Content-Length: " + length,
                            response.status_code);
    }
    metadata.etag = TrimETag(response.Header("etag"));
    metadata.last_modified = response.Header("last-modified");
    metadata.version_id = response.Header("x-amz-version-id");
    metadata.content_type = response.Header("content-type");
    return metadata;
}

std::string S3Client::GetObjectRange(const std::string& bucket, const std::string& key, std::uint64_t start,
                                     std::uint64_t end, const std::string& if_match,
                                     const ProgressCallback& on_bytes, const CancellationToken* cancel) {
    ValidateObject(bucket, key);

    HttpRequest request = NewRequest("GET", bucket, key, cancel);
    if (!if_match.empty()) {
        request.headers["If-Match"] = "\"" + if_match + "\"";
    }
    SignRequest(request);

    HttpResponse response;
    try {
        response = transport_.DownloadRange(request, start, end, on_bytes);
    } catch (const ProtocolError& e) {
        if (e.HttpStatus() == 412) {
            throw IntegrityError("Object " + bucket + "/" + key + " changed during download (ETag mismatch)");
        }
        throw;
    }

    // 200 means the server ignored Range; only acceptable when the range is the whole object.
    if (response.status_code == 200 && !(start == 0 && response.body.size() == end + 1)) {
        throw ProtocolError("Server ignored Range " + RangeHeaderValue(start, end) + " for " + bucket + "/" + key,
                            response.status_code);
    }
    return std::move(response.body);
}

PresignedUrl S3Client::PresignUrl(const std::string& method, const std::string& bucket, const std::string& key,
                                  std::chrono::seconds expiry) const {
    ValidateObject(bucket, key);
    if (method != "GET" && method != "PUT" && method != "DELETE" && method != "HEAD") {
        throw ValidationError("Unsupported presign method: " + method);
    }

    PresignedUrl result;
    result.method = method;
    result.created = std::chrono::system_clock::now();
    result.expires = result.created + expiry;
    result.url = signer_.Presign(method, scheme_, host_, ObjectPath(bucket, key), credentials_, expiry,
                                 result.created);
    return result;
}
