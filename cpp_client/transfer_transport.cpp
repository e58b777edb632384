#include "transfer_transport.hpp"
#include "s3_xml.hpp"
#include "transfer_errors.hpp"

bool IsRetryableStatus(int status) {
    return status == 408 || status == 429 || (status >= 500 && status < 600);
}

void RaiseForStatus(const HttpRequest& request, const HttpResponse& response) {
    int status = response.status_code;
    if (status >= 200 && status < 300) {
        return;
    }

    std::string code;
    std::string detail;
    if (auto error = ParseErrorDocument(response.body)) {
        code = error->code;
        detail = error->message;
    }

    std::string message = request.method + " " + request.path + " returned HTTP " + std::to_string(status);
    if (!code.empty()) message += " " + code;
    if (!detail.empty()) message += ": " + detail;

    if (IsRetryableStatus(status)) {
        throw TransportError(message, status);
    }
    throw ProtocolError(message, status, code);
}

std::string RangeHeaderValue(std::uint64_t start, std::uint64_t end) {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
}
