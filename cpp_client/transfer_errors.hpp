#ifndef TRANSFER_ERRORS_HPP
#define TRANSFER_ERRORS_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Validation,
    Transport,
    Protocol,
    Integrity,
    ResumeInvalid,
    Cancelled,
    Internal
};

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::Integrity: return "IntegrityError";
        case ErrorKind::ResumeInvalid: return "ResumeInvalidError";
        case ErrorKind::Cancelled: return "CancelledError";
        default: return "InternalError";
    }
}

// Base of every error raised by the transfer core.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Bad caller input: empty identifiers, invalid expiry, invalid chunk size.
class ValidationError : public TransferError {
public:
    explicit ValidationError(const std::string& message)
        : TransferError(ErrorKind::Validation, message) {}
};

// Timeouts, connection resets, throttling and 5xx responses.
class TransportError : public TransferError {
public:
    explicit TransportError(const std::string& message, int http_status = 0)
        : TransferError(ErrorKind::Transport, message), http_status_(http_status) {}

    int HttpStatus() const { return http_status_; }

private:
    int http_status_;
};

// Unexpected status codes and malformed response bodies.
class ProtocolError : public TransferError {
public:
    ProtocolError(const std::string& message, int http_status = 0, const std::string& s3_code = "")
        : TransferError(ErrorKind::Protocol, message), http_status_(http_status), s3_code_(s3_code) {}

    int HttpStatus() const { return http_status_; }
    const std::string& S3Code() const { return s3_code_; }

private:
    int http_status_;
    std::string s3_code_;
};

// Checksum/ETag mismatch or a chunk whose bytes do not match its range.
class IntegrityError : public TransferError {
public:
    explicit IntegrityError(const std::string& message)
        : TransferError(ErrorKind::Integrity, message) {}
};

// Persisted state is stale or its fingerprint no longer matches the source.
class ResumeInvalidError : public TransferError {
public:
    explicit ResumeInvalidError(const std::string& message)
        : TransferError(ErrorKind::ResumeInvalid, message) {}
};

class CancelledError : public TransferError {
public:
    explicit CancelledError(const std::string& message = "transfer cancelled")
        : TransferError(ErrorKind::Cancelled, message) {}
};

#endif // TRANSFER_ERRORS_HPP
