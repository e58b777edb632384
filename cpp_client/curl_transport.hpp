#ifndef CURL_TRANSPORT_HPP
#define CURL_TRANSPORT_HPP

#include <string>
#include "config.hpp"
#include "transfer_transport.hpp"

// libcurl transport. One easy handle per call, so a single instance is safe to
// share between transfer workers.
class CurlTransport : public TransferTransport {
public:
    explicit CurlTransport(const Config::TransferConfig& config);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse Execute(const HttpRequest& request) override;
    HttpResponse UploadBody(const HttpRequest& request, const BodyReader& reader, std::uint64_t size,
                            const ProgressCallback& on_bytes) override;
    HttpResponse DownloadRange(const HttpRequest& request, std::uint64_t start, std::uint64_t end,
                               const ProgressCallback& on_bytes) override;

    std::string BuildUrl(const HttpRequest& request) const;

private:
    struct Body {
        const BodyReader* reader = nullptr;
        std::uint64_t size = 0;
    };

    HttpResponse Perform(const HttpRequest& request, const Body* body, const ProgressCallback* on_bytes);

    std::string base_url_;
    bool verify_tls_;
    long timeout_seconds_;
    long connect_timeout_seconds_;
    long progress_interval_ms_;
};

#endif // CURL_TRANSPORT_HPP
