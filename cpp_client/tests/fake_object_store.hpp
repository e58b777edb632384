#ifndef FAKE_OBJECT_STORE_HPP
#define FAKE_OBJECT_STORE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "config.hpp"
#include "request_signer.hpp"
#include "transfer_transport.hpp"

// In-memory S3 endpoint behind the TransferTransport interface. Verifies the SigV4
// signature of every request and supports failure injection and per-request delays.
class FakeObjectStore : public TransferTransport {
public:
    struct RecordedRequest {
        std::string method;
        std::string path;
        std::map<std::string, std::string> query;
        std::map<std::string, std::string> headers;
        std::uint64_t range_start = 0;
        std::uint64_t range_end = 0;
    };

    explicit FakeObjectStore(const Config::TransferConfig& config);

    HttpResponse Execute(const HttpRequest& request) override;
    HttpResponse UploadBody(const HttpRequest& request, const BodyReader& reader, std::uint64_t size,
                            const ProgressCallback& on_bytes) override;
    HttpResponse DownloadRange(const HttpRequest& request, std::uint64_t start, std::uint64_t end,
                               const ProgressCallback& on_bytes) override;

    void PutObject(const std::string& bucket, const std::string& key, const std::string& data);
    bool HasObject(const std::string& bucket, const std::string& key) const;
    std::string GetObject(const std::string& bucket, const std::string& key) const;
    std::string ObjectETag(const std::string& bucket, const std::string& key) const;
    // Content-Type and x-amz-meta-* headers sent when the object's multipart upload was created.
    std::map<std::string, std::string> ObjectHeaders(const std::string& bucket, const std::string& key) const;

    // The next `count` requests for the part / range / operation answer with `status`.
    void FailPart(int part_number, int count, int status = 500);
    void FailRange(std::uint64_t start, int count, int status = 500);
    void FailComplete(int count, int status = 500);
    void FailCreate(int count, int status = 500);
    void CorruptPartETag(int part_number);

    void SetPartDelay(int part_number, std::chrono::milliseconds delay);
    void SetRangeDelay(std::uint64_t start, std::chrono::milliseconds delay);

    // Called after a part has been stored (outside the store lock).
    void SetPartHook(std::function<void(int part_number)> hook);
    void SetRangeHook(std::function<void(std::uint64_t start)> hook);
    // Called after a successful CompleteMultipartUpload, before the response is returned.
    void SetCompleteHook(std::function<void()> hook);

    std::vector<RecordedRequest> Requests() const;
    int CountRequests(const std::string& method, const std::string& query_key = "") const;
    std::vector<int> UploadedPartNumbers() const;      // every successful part PUT, in arrival order
    std::vector<int> LastCompletedPartOrder() const;   // part numbers of the last CompleteMultipartUpload
    std::vector<std::string> AbortedUploads() const;
    std::size_t OpenUploads() const;
    int MaxConcurrentRequests() const;

private:
    struct MultipartUpload {
        std::string bucket;
        std::string key;
        std::map<int, std::string> parts;
        std::map<std::string, std::string> metadata;
    };

    struct Object {
        std::string data;
        std::string etag;
        std::map<std::string, std::string> metadata;
    };

    struct InFlight {
        FakeObjectStore* store;
        explicit InFlight(FakeObjectStore* s);
        ~InFlight();
    };

    void Record(const HttpRequest& request, std::uint64_t start = 0, std::uint64_t end = 0);
    void VerifySignature(const HttpRequest& request) const;
    void Delay(std::chrono::milliseconds delay, const CancellationToken* cancel) const;
    bool TakeFailure(std::map<std::int64_t, std::pair<int, int>>& failures, std::int64_t key, int* status);
    static std::string ObjectKey(const std::string& bucket, const std::string& key);
    static void SplitPath(const std::string& path, std::string* bucket, std::string* key);
    [[noreturn]] static void Fail(const HttpRequest& request, int status, const std::string& code,
                                  const std::string& message);

    HttpResponse CreateUpload(const HttpRequest& request);
    HttpResponse CompleteUpload(const HttpRequest& request);
    HttpResponse AbortUpload(const HttpRequest& request);
    HttpResponse HeadObject(const HttpRequest& request);

    Credentials credentials_;
    RequestSigner signer_;

    mutable std::mutex mutex_;
    std::map<std::string, Object> objects_;
    std::map<std::string, MultipartUpload> uploads_;
    int next_upload_ = 1;

    std::map<std::int64_t, std::pair<int, int>> part_failures_;  // part -> (remaining, status)
    std::map<std::int64_t, std::pair<int, int>> range_failures_; // start -> (remaining, status)
    std::map<std::int64_t, std::pair<int, int>> op_failures_;    // 0 = create, 1 = complete
    std::map<int, bool> corrupt_parts_;
    std::map<int, std::chrono::milliseconds> part_delays_;
    std::map<std::uint64_t, std::chrono::milliseconds> range_delays_;
    std::function<void(int)> part_hook_;
    std::function<void(std::uint64_t)> range_hook_;
    std::function<void()> complete_hook_;

    std::vector<RecordedRequest> requests_;
    std::vector<int> uploaded_parts_;
    std::vector<int> last_completed_order_;
    std::vector<std::string> aborted_;
    int in_flight_ = 0;
    int max_in_flight_ = 0;
};

#endif // FAKE_OBJECT_STORE_HPP
