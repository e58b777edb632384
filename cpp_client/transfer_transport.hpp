#ifndef TRANSFER_TRANSPORT_HPP
#define TRANSFER_TRANSPORT_HPP

#include <cstdint>
#include "http_types.hpp"

// Executes already-signed requests against the object store.
// Non-2xx responses are raised as TransportError (retryable statuses) or ProtocolError;
// a cancelled request raises CancelledError.
class TransferTransport {
public:
    virtual ~TransferTransport() = default;

    // Small request/response exchanges (XML bodies, HEAD, DELETE).
    virtual HttpResponse Execute(const HttpRequest& request) = 0;

    // Streams `size` bytes from `reader` as the request body.
    virtual HttpResponse UploadBody(const HttpRequest& request, const BodyReader& reader, std::uint64_t size,
                                    const ProgressCallback& on_bytes) = 0;

    // GET with "Range: bytes=start-end" (inclusive); the body holds the returned bytes.
    virtual HttpResponse DownloadRange(const HttpRequest& request, std::uint64_t start, std::uint64_t end,
                                       const ProgressCallback& on_bytes) = 0;
};

// 408, 429 and 5xx are worth retrying.
bool IsRetryableStatus(int status);

// Throws the error that matches a non-2xx response; returns normally for 2xx.
void RaiseForStatus(const HttpRequest& request, const HttpResponse& response);

std::string RangeHeaderValue(std::uint64_t start, std::uint64_t end);

#endif // TRANSFER_TRANSPORT_HPP
