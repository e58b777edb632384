#include "curl_transport.hpp"
#include "logger.hpp"
#include "request_signer.hpp"
#include "transfer_errors.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <exception>
#include <memory>

namespace {
using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

struct CallContext {
    const HttpRequest* request = nullptr;
    const BodyReader* reader = nullptr;
    HttpResponse* response = nullptr;
    const ProgressCallback* on_bytes = nullptr;
    bool uploading = false;
    std::chrono::milliseconds interval{250};
    std::chrono::steady_clock::time_point last_report;
    std::uint64_t last_reported = 0;
    std::exception_ptr callback_error;

    bool Cancelled() const { return request->cancel && request->cancel->IsCancelled(); }
};

void AppendHeader(HeaderList& list, const std::string& line) {
    curl_slist* next = curl_slist_append(list.get(), line.c_str());
    if (!next) {
        throw TransportError("Failed to allocate request header list");
    }
    list.release();
    list.reset(next);
}

std::string Trim(const std::string& value) {
    size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

size_t ReadCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<CallContext*>(userdata);
    if (ctx->Cancelled()) {
        return CURL_READFUNC_ABORT;
    }
    try {
        return (*ctx->reader)(buffer, size * nitems);
    } catch (...) {
        // Rethrown on the calling thread once curl_easy_perform returns.
        ctx->callback_error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<CallContext*>(userdata);
    if (ctx->Cancelled()) {
        return 0;
    }
    size_t total = size * nmemb;
    ctx->response->body.append(ptr, total);
    return total;
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<CallContext*>(userdata);
    size_t total = size * nitems;
    std::string line(buffer, total);

    // A new status line (redirect, 100-continue) starts a fresh header block.
    if (line.compare(0, 5, "HTTP/") == 0) {
        ctx->response->headers.clear();
        return total;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = Trim(line.substr(0, colon));
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        ctx->response->headers[name] = Trim(line.substr(colon + 1));
    }
    return total;
}

int ProgressCallbackFn(void* clientp, curl_off_t /*dltotal*/, curl_off_t dlnow, curl_off_t /*ultotal*/,
                       curl_off_t ulnow) {
    auto* ctx = static_cast<CallContext*>(clientp);
    if (ctx->Cancelled()) {
        return 1;
    }
    if (!ctx->on_bytes || !*ctx->on_bytes) {
        return 0;
    }

    auto bytes = static_cast<std::uint64_t>(ctx->uploading ? ulnow : dlnow);
    auto now = std::chrono::steady_clock::now();
    if (bytes > ctx->last_reported && now - ctx->last_report >= ctx->interval) {
        ctx->last_reported = bytes;
        ctx->last_report = now;
        try {
            (*ctx->on_bytes)(bytes);
        } catch (...) {
            ctx->callback_error = std::current_exception();
            return 1;
        }
    }
    return 0;
}
} // namespace

CurlTransport::CurlTransport(const Config::TransferConfig& config)
    : base_url_(config.BaseUrl()), verify_tls_(config.verify_tls),
      timeout_seconds_(config.timeout_seconds), connect_timeout_seconds_(config.connect_timeout_seconds),
      progress_interval_ms_(config.progress_interval_ms) {
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

std::string CurlTransport::BuildUrl(const HttpRequest& request) const {
    std::string url = base_url_ + (request.path.empty() ? "/" : request.path);
    std::string query = RequestSigner::CanonicalQueryString(request.query);
    if (!query.empty()) {
        url += "?" + query;
    }
    return url;
}

HttpResponse CurlTransport::Execute(const HttpRequest& request) {
    if (request.method == "PUT") {
        size_t offset = 0;
        const std::string& data = request.body;
        BodyReader reader = [&data, &offset](char* buffer, size_t max) {
            size_t n = std::min(max, data.size() - offset);
            std::memcpy(buffer, data.data() + offset, n);
            offset += n;
            return n;
        };
        Body body{&reader, data.size()};
        return Perform(request, &body, nullptr);
    }
    return Perform(request, nullptr, nullptr);
}

HttpResponse CurlTransport::UploadBody(const HttpRequest& request, const BodyReader& reader, std::uint64_t size,
                                       const ProgressCallback& on_bytes) {
    Body body{&reader, size};
    return Perform(request, &body, &on_bytes);
}

HttpResponse CurlTransport::DownloadRange(const HttpRequest& request, std::uint64_t start, std::uint64_t end,
                                          const ProgressCallback& on_bytes) {
    if (end < start) {
        throw ValidationError("Invalid byte range " + std::to_string(start) + "-" + std::to_string(end));
    }
    HttpRequest ranged = request;
    ranged.headers["Range"] = RangeHeaderValue(start, end);
    return Perform(ranged, nullptr, &on_bytes);
}

HttpResponse CurlTransport::Perform(const HttpRequest& request, const Body* body,
                                    const ProgressCallback* on_bytes) {
    if (request.cancel && request.cancel->IsCancelled()) {
        throw CancelledError();
    }

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw TransportError("curl_easy_init failed");
    }

    HttpResponse response;
    CallContext ctx;
    ctx.request = &request;
    ctx.reader = body ? body->reader : nullptr;
    ctx.response = &response;
    ctx.on_bytes = on_bytes;
    ctx.uploading = body != nullptr;
    ctx.interval = std::chrono::milliseconds(progress_interval_ms_);
    ctx.last_report = std::chrono::steady_clock::now();

    HeaderList headers(nullptr, &curl_slist_free_all);
    for (const auto& header : request.headers) {
        if (header.second.empty()) {
            AppendHeader(headers, header.first + ";");
        } else {
            AppendHeader(headers, header.first + ": " + header.second);
        }
    }
    // Suppress the 100-continue round trip on part uploads.
    AppendHeader(headers, "Expect:");

    std::string url = BuildUrl(request);
    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    if (body) {
        curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
        if (request.method != "PUT") {
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        curl_easy_setopt(handle, CURLOPT_READFUNCTION, ReadCallback);
        curl_easy_setopt(handle, CURLOPT_READDATA, &ctx);
        curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(body->size));
    } else if (request.method == "GET") {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "HEAD") {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else if (request.method == "POST") {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    } else {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }
    }

    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, ProgressCallbackFn);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);

    curl_easy_setopt(handle, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, verify_tls_ ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, verify_tls_ ? 2L : 0L);

    CURLcode res = curl_easy_perform(handle);

    if (ctx.callback_error) {
        std::rethrow_exception(ctx.callback_error);
    }
    if (res != CURLE_OK) {
        if (ctx.Cancelled()) {
            throw CancelledError();
        }
        std::string message = request.method + " " + request.path + " failed: " + curl_easy_strerror(res);
        Logger::Debug(message, "Transport");
        throw TransportError(message);
    }

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = static_cast<int>(status);

    RaiseForStatus(request, response);

    if (on_bytes && *on_bytes) {
        (*on_bytes)(body ? body->size : response.body.size());
    }
    return response;
}
