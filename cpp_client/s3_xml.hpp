#ifndef S3_XML_HPP
#define S3_XML_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct InitiateMultipartUploadResult {
    std::string bucket;
    std::string key;
    std::string upload_id;
};

struct CompleteMultipartUploadResult {
    std::string location;
    std::string bucket;
    std::string key;
    std::string etag; // unquoted
};

struct S3ErrorDocument {
    std::string code;
    std::string message;
    std::string resource;
    std::string request_id;
};

// One uploaded part, as submitted to CompleteMultipartUpload.
struct PartResult {
    int part_number = 0;
    std::string etag;
    std::uint64_t size = 0;
};

// Strips surrounding double quotes and blanks from an ETag header value.
std::string TrimETag(const std::string& etag);

// Throw ProtocolError when the body is not the expected document.
InitiateMultipartUploadResult ParseInitiateMultipartUpload(const std::string& body);
CompleteMultipartUploadResult ParseCompleteMultipartUpload(const std::string& body);

// Empty when the body is not an <Error> document.
std::optional<S3ErrorDocument> ParseErrorDocument(const std::string& body);

// Parts must be non-empty and strictly ascending by part number.
std::string BuildCompleteMultipartUploadXml(const std::vector<PartResult>& parts);

// Reads the <Part> list of a CompleteMultipartUpload request body, in document order.
std::vector<PartResult> ParseCompleteMultipartUploadRequest(const std::string& body);

#endif // S3_XML_HPP
